#pragma once

/*
    Split edit text into literal fragments.

    Lines such as

        // ... existing code ...

    stand for "whatever is already in the file here". They separate the
    fragments and are never part of one. The fragments are returned in the
    order they appear.
*/

#include <string>
#include <vector>

namespace patchy {

using Fragment = std::vector<std::string>;

// True if `line` holds a comment token followed by an ellipsis and
// "existing code", as in "// ... existing code ...". Case and spacing don't
// matter and the marker may start anywhere on the line.
bool
is_elision_marker(const std::string& line, const std::vector<std::string>& comment_tokens);

// Text without markers is one fragment. Adjacent markers give no fragment.
// If the text has lines but only markers, all of its lines (markers
// included) become a single fragment.
std::vector<Fragment>
segment_edit(const std::string& edit_text, const std::vector<std::string>& comment_tokens);

}  // namespace patchy
