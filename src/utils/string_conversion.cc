#include "sqlcomplete/utils/string_conversion.h"

namespace sqlcomplete {

namespace {

constexpr std::array<unsigned char, 256> buildToLowerTable() {
    std::array<unsigned char, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        auto c = static_cast<unsigned char>(i);
        table[i] = (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c + ('a' - 'A')) : c;
    }
    return table;
}

}  // namespace

const std::array<unsigned char, 256> TOLOWER_ASCII_TABLE = buildToLowerTable();

}  // namespace sqlcomplete
