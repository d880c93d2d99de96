#include "datastore/types.hpp"
#include "datastore/list.hpp"
#include "datastore/map.hpp"
#include "datastore/string.hpp"
#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace datastore {

const char* to_string(db_type type) noexcept {
    switch (type) {
        case db_type::list: return "list";
        case db_type::map: return "map";
        case db_type::string: return "string";
        case db_type::record: return "record";
        case db_type::table: return "table";
    }
    return "list";
}

std::string generate_db_id() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    uint64_t a = dis(gen);
    uint64_t b = dis(gen);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
        bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
    }

    // Set version (4) and variant (RFC 4122)
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

bool same_value(const record_value& a, const record_value& b) {
    if (a.index() != b.index()) return false;
    return std::visit([&b](const auto& lhs) {
        using T = std::decay_t<decltype(lhs)>;
        return lhs == std::get<T>(b);
    }, a);
}

db_object* owned_object(const record_value& value) noexcept {
    return std::visit([](const auto& v) -> db_object* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, json>) {
            return nullptr;
        } else {
            return v.get();
        }
    }, value);
}

json to_json(const record_value& value) {
    if (auto* object = owned_object(value)) {
        return object->to_json();
    }
    if (auto* j = std::get_if<json>(&value)) {
        return *j;
    }
    return nullptr;
}

} // namespace datastore
