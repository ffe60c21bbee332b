#include "algorithms/PatternLibrary.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace algorithms {

namespace {

struct MethodEntry {
    WipeMethod method;
    std::string_view name;
    std::string_view display_name;
    bool verification_required;
    size_t pass_count;
    std::array<PatternKind, 3> passes;
};

constexpr std::array METHOD_TABLE{
    MethodEntry{WipeMethod::QUICK, "quick", "Quick (1-pass random)", false, 1,
                {PatternKind::RANDOM, PatternKind::RANDOM, PatternKind::RANDOM}},
    MethodEntry{WipeMethod::NIST, "nist", "NIST SP 800-88 Clear", true, 1,
                {PatternKind::RANDOM, PatternKind::RANDOM, PatternKind::RANDOM}},
    MethodEntry{WipeMethod::DOD, "dod", "DoD 5220.22-M", true, 3,
                {PatternKind::ZEROS, PatternKind::ONES, PatternKind::RANDOM}},
};

auto find_entry(WipeMethod method) -> const MethodEntry* {
    const auto it = std::find_if(METHOD_TABLE.begin(), METHOD_TABLE.end(),
                                 [method](const MethodEntry& e) { return e.method == method; });
    return it == METHOD_TABLE.end() ? nullptr : &*it;
}

}  // namespace

auto passes_for(WipeMethod method) -> std::expected<std::vector<PassSpec>, util::Error> {
    const auto* entry = find_entry(method);
    if (entry == nullptr) {
        return std::unexpected(
            util::Error{util::ErrorCode::INVALID_METHOD,
                        "Unknown wipe method id " + std::to_string(static_cast<int>(method))});
    }

    std::vector<PassSpec> passes;
    passes.reserve(entry->pass_count);
    for (size_t i = 0; i < entry->pass_count; ++i) {
        passes.push_back(PassSpec{.pattern = entry->passes[i], .index = static_cast<int>(i)});
    }
    return passes;
}

auto parse_method(std::string_view name) -> std::expected<WipeMethod, util::Error> {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Long form of the DoD identifier
    if (lower == "dod-5220-22-m" || lower == "dod522022m") {
        return WipeMethod::DOD;
    }

    for (const auto& entry : METHOD_TABLE) {
        if (entry.name == lower) {
            return entry.method;
        }
    }
    return std::unexpected(util::Error{util::ErrorCode::INVALID_METHOD,
                                       "Unknown wipe method '" + std::string{name} + "'"});
}

auto method_name(WipeMethod method) -> std::string_view {
    const auto* entry = find_entry(method);
    return entry ? entry->name : "unknown";
}

auto method_display_name(WipeMethod method) -> std::string_view {
    const auto* entry = find_entry(method);
    return entry ? entry->display_name : "Unknown";
}

auto requires_verification(WipeMethod method) -> bool {
    const auto* entry = find_entry(method);
    return entry != nullptr && entry->verification_required;
}

auto pattern_name(PatternKind pattern) -> std::string_view {
    switch (pattern) {
        case PatternKind::ZEROS:
            return "zeros";
        case PatternKind::ONES:
            return "ones";
        case PatternKind::RANDOM:
            return "random";
    }
    return "unknown";
}

auto pattern_fill_byte(PatternKind pattern) -> std::optional<uint8_t> {
    switch (pattern) {
        case PatternKind::ZEROS:
            return uint8_t{0x00};
        case PatternKind::ONES:
            return uint8_t{0xFF};
        case PatternKind::RANDOM:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace algorithms
