#include "edit_report.hpp"

#include <fmt/format.h>

using namespace patchy;

namespace {

std::string
strip_terminator(const std::string& text) {
    auto end = text.size();
    if (end > 0 && text[end - 1] == '\n') {
        end--;
        if (end > 0 && text[end - 1] == '\r') {
            end--;
        }
    }
    return text.substr(0, end);
}

std::string
colorize(const std::string& text, const TermStyle& term_style, bool enabled) {
    if (!enabled) {
        return text;
    }
    const auto escape = term_style.to_ansi();
    if (escape.empty()) {
        return text;
    }
    return escape + text + term_reset();
}

}  // namespace

std::string
patchy::render_diff_line(const DiffLine& line, const EditReportStyle& style) {
    const auto text = strip_terminator(line.text);
    switch (line.tag) {
        case DiffTag::Added:
            return colorize(fmt::format("+ {}", text), style.added, style.color);
        case DiffTag::Removed:
            return colorize(fmt::format("- {}", text), style.removed, style.color);
        case DiffTag::Unchanged:
            return colorize(fmt::format("  {}", text), style.unchanged, style.color);
    }
    return text;
}

std::vector<std::string>
patchy::edit_report_render(const EditOutcome& outcome, const EditReportStyle& style) {
    std::vector<std::string> report;

    if (!outcome.success) {
        report.push_back(fmt::format("error: {}", outcome.error));
        return report;
    }

    report.push_back(
        colorize(fmt::format("{} {}", outcome.created ? "Created" : "Modified", outcome.file), style.header,
                 style.color));

    report.reserve(outcome.changes.size() + 1);
    for (const auto& line : outcome.changes) {
        report.push_back(render_diff_line(line, style));
    }
    return report;
}
