#pragma once

#include "processing/edit_apply.hpp"
#include "util/color.hpp"

#include <string>
#include <vector>

namespace patchy {

struct EditReportStyle {
    bool color = false;

    TermStyle header = TermStyle{TermColor::kNone, TermColor::kNone, TermStyle::Attribute::Bold};
    TermStyle added = TermStyle{TermColor::kGreen, TermColor::kNone};
    TermStyle removed = TermStyle{TermColor::kRed, TermColor::kNone};
    TermStyle unchanged = TermStyle{};
};

// "+ ", "- " or "  " followed by the line without its terminator.
std::string
render_diff_line(const DiffLine& line, const EditReportStyle& style);

// A header naming the file, then one entry per diff line. Failed outcomes
// render as a single error line.
std::vector<std::string>
edit_report_render(const EditOutcome& outcome, const EditReportStyle& style);

}  // namespace patchy
