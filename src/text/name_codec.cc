#include "sqlcomplete/text/name_codec.h"

namespace sqlcomplete {

namespace {

constexpr bool isLeadingChar(char c) { return c == '_' || (c >= 'a' && c <= 'z'); }
constexpr bool isTrailingChar(char c) { return isLeadingChar(c) || (c >= '0' && c <= '9') || c == '$'; }

}  // namespace

bool NameCodec::IsPlainName(std::string_view name) {
    if (name.empty() || !isLeadingChar(name[0])) {
        return false;
    }
    for (size_t i = 1; i < name.size(); ++i) {
        if (!isTrailingChar(name[i])) {
            return false;
        }
    }
    return true;
}

std::string NameCodec::Escape(std::string_view name) {
    if (IsPlainName(name)) {
        return std::string{name};
    }
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    out += name;
    out += '"';
    return out;
}

std::string NameCodec::Unescape(std::string_view name) {
    if (!name.empty() && name.front() == '"' && name.back() == '"') {
        // A lone quote is both the first and the last character
        name = name.size() == 1 ? std::string_view{} : name.substr(1, name.size() - 2);
    }
    return std::string{name};
}

std::vector<std::string> NameCodec::EscapeAll(std::span<const std::string> names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (auto& name : names) {
        out.push_back(Escape(name));
    }
    return out;
}

}  // namespace sqlcomplete
