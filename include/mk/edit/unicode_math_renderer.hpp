#pragma once

#include "mk/edit/decorations.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace mk::edit
{

// Approximates TeX formulas with Unicode text for terminal display: Greek
// letters, common operators and relations, ^/_ scripts where Unicode has
// them, \frac as a/b, \sqrt as a radical and \text{...} verbatim. Unknown
// commands are dropped.
class UnicodeMathRenderer : public MathRenderer
{
public:
    std::string render(std::string_view formula) override;

    static std::string toUnicode(std::string_view formula);

private:
    std::unordered_map<std::string, std::string> cache;
};

} // namespace mk::edit
