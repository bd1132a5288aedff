#include "NumberingService.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <fmt/format.h>

namespace {

std::string escape_regex(const std::string& text)
{
    static const std::string special = R"(\^$.|?*+()[]{}/)";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char ch : text) {
        if (special.find(ch) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

std::uint64_t parse_digits(const std::string& digits)
{
    std::uint64_t value = 0;
    for (char ch : digits) {
        const std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace


NumberingService::NumberingService(NumberingConfig config)
    : config_(std::move(config))
{
    const std::string& tmpl = config_.name_template;
    const auto name_pos = tmpl.find("{name}");
    const auto number_pos = tmpl.find("{number");
    const auto number_end = number_pos == std::string::npos ? std::string::npos : tmpl.find('}', number_pos);
    const auto ext_pos = tmpl.find("{ext}");

    if (name_pos == std::string::npos || number_pos == std::string::npos ||
        number_end == std::string::npos || ext_pos == std::string::npos ||
        !(name_pos < number_pos && number_end < ext_pos)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Numbering template must contain {name}, {number} and {ext} in this order",
                            tmpl);
    }
    const std::string number_spec = tmpl.substr(number_pos + 7, number_end - (number_pos + 7));
    if (!number_spec.empty()) {
        // Only a zero-padded width is accepted: ":0Nd". It takes precedence over digit_width.
        const bool well_formed = number_spec.size() >= 4 && number_spec.size() <= 5 &&
                                 number_spec.rfind(":0", 0) == 0 &&
                                 number_spec.back() == 'd' &&
                                 std::all_of(number_spec.begin() + 2, number_spec.end() - 1,
                                             [](unsigned char ch) { return std::isdigit(ch) != 0; });
        if (!well_formed) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                                "Number placeholder must be {number} or {number:0Nd}",
                                tmpl);
        }
        config_.digit_width = std::stoi(number_spec.substr(2, number_spec.size() - 3));
    }
    if (config_.digit_width < 1) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Numbering digit width must be positive",
                            std::to_string(config_.digit_width));
    }

    prefix_ = tmpl.substr(0, name_pos);
    separator_ = tmpl.substr(name_pos + 6, number_pos - (name_pos + 6));
    closing_ = tmpl.substr(number_end + 1, ext_pos - (number_end + 1));
    trailer_ = tmpl.substr(ext_pos + 5);

    const std::string pattern = "^" + escape_regex(prefix_) + "(.+)" + escape_regex(separator_) +
                                "([0-9]{" + std::to_string(config_.digit_width) + ",})" +
                                escape_regex(closing_) + "(\\.[^.]*)?" + escape_regex(trailer_) + "$";
    suffix_pattern_ = std::regex(pattern);
}


NumberingService::ParsedName NumberingService::split_name(const std::string& file_name) const
{
    ParsedName parsed;
    std::smatch match;
    if (std::regex_match(file_name, match, suffix_pattern_)) {
        parsed.base_name = match[1].str();
        parsed.number = parse_digits(match[2].str());
        parsed.width = static_cast<int>(match[2].length());
        parsed.extension = match[3].matched ? match[3].str() : std::string();
        return parsed;
    }

    const fs::path name_path = Utils::utf8_to_path(file_name);
    parsed.base_name = Utils::path_to_utf8(name_path.stem());
    parsed.extension = Utils::path_to_utf8(name_path.extension());
    return parsed;
}


std::pair<std::string, std::uint64_t> NumberingService::parse_numbered_name(const std::string& path) const
{
    const std::string file_name = Utils::path_to_utf8(Utils::utf8_to_path(path).filename());
    const ParsedName parsed = split_name(file_name);
    return {parsed.base_name, parsed.number.value_or(0)};
}


NumberingService::CounterState NumberingService::scan_directory(const std::string& directory,
                                                                const std::string& base_name) const
{
    CounterState state;
    try {
        for (const auto& name : scanner_.list_names(directory)) {
            const ParsedName parsed = split_name(name);
            if (parsed.number && parsed.base_name == base_name) {
                state.highest = std::max(state.highest, *parsed.number);
                state.width = std::max(state.width, parsed.width);
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Cannot scan '{}' for numbered names, assuming none: {}", directory, ex.what());
        }
        return CounterState{};
    }
    return state;
}


std::uint64_t NumberingService::threshold_for_width(int width) const
{
    if (width <= config_.digit_width) {
        return config_.rollover_threshold;
    }
    std::uint64_t limit = 1;
    for (int i = 0; i < width; ++i) {
        if (limit > std::numeric_limits<std::uint64_t>::max() / 10) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        limit *= 10;
    }
    return limit - 1;
}


std::string NumberingService::format_name(const std::string& base_name, std::uint64_t number,
                                          int width, const std::string& extension) const
{
    return fmt::format("{}{}{}{:0{}}{}{}{}", prefix_, base_name, separator_, number, width,
                       closing_, extension, trailer_);
}


std::string NumberingService::generate_numbered_name(const std::string& path)
{
    const fs::path original = Utils::utf8_to_path(path);
    const fs::path directory = Utils::normalize_path(original.parent_path().empty()
                                                         ? fs::path(".")
                                                         : original.parent_path());
    const std::string directory_key = Utils::path_to_utf8(directory);
    const ParsedName parsed = split_name(Utils::path_to_utf8(original.filename()));

    const Key key{directory_key, parsed.base_name};
    CounterState& state = counters_[key];
    if (!state.scanned) {
        const CounterState found = scan_directory(directory_key, parsed.base_name);
        state.highest = std::max(state.highest, found.highest);
        state.width = std::max(state.width, found.width);
        state.scanned = true;
    }

    if (parsed.number) {
        state.highest = std::max(state.highest, *parsed.number);
    }
    int width = std::max({config_.digit_width, state.width, parsed.width});
    std::uint64_t next = std::max(config_.start_number, state.highest + 1);

    fs::path candidate;
    while (true) {
        while (next > threshold_for_width(width)) {
            ++width;
        }
        candidate = directory / Utils::utf8_to_path(format_name(parsed.base_name, next, width, parsed.extension));
        if (!Utils::entry_exists(candidate)) {
            break;
        }
        ++next;
    }

    if (width > std::max(state.width, config_.digit_width)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Numbering for '{}' in '{}' widened to {} digits", parsed.base_name, directory_key, width);
        }
    }
    state.highest = next;
    state.width = width;

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Numbered name for '{}': '{}'", path, Utils::path_to_utf8(candidate));
    }
    return Utils::path_to_utf8(candidate);
}


std::optional<std::uint64_t> NumberingService::highest_issued(const std::string& directory,
                                                              const std::string& base_name) const
{
    const std::string directory_key = Utils::path_to_utf8(Utils::normalize_path(Utils::utf8_to_path(directory)));
    if (auto it = counters_.find(Key{directory_key, base_name}); it != counters_.end()) {
        return it->second.highest;
    }
    return std::nullopt;
}


void NumberingService::seed(const NumberingRecord& record)
{
    const std::string directory_key =
        Utils::path_to_utf8(Utils::normalize_path(Utils::utf8_to_path(record.directory)));
    CounterState& state = counters_[Key{directory_key, record.base_name}];
    state.highest = std::max(state.highest, record.highest);
    state.width = std::max(state.width, record.width);
}


std::vector<NumberingRecord> NumberingService::records() const
{
    std::vector<NumberingRecord> result;
    result.reserve(counters_.size());
    for (const auto& [key, state] : counters_) {
        result.push_back(NumberingRecord{key.first, key.second, state.highest, state.width});
    }
    return result;
}


void NumberingService::clear()
{
    counters_.clear();
}
