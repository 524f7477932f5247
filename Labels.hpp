#ifndef LABELS_DOT_HPP
#define LABELS_DOT_HPP

#include <string>
#include <string_view>
#include <vector>

namespace Labels {
// Root-most label last; empty labels are dropped, so a trailing dot
// or a doubled dot does not produce an empty label.
std::vector<std::string> split(std::string_view host);

// The last `level` labels joined with '.'; `level` must not exceed
// the number of labels.
std::string tail(std::vector<std::string> const& labels, int level);
} // namespace Labels

#endif // LABELS_DOT_HPP
