#ifndef NUMBERING_SERVICE_HPP
#define NUMBERING_SERVICE_HPP

#include "FileScanner.hpp"
#include "Types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

struct NumberingRecord {
    std::string directory;
    std::string base_name;
    std::uint64_t highest{0};
    int width{0};
};

/**
 * @brief Generates collision-free numbered names such as `report_00003.pdf`.
 *
 * Keeps the highest number issued per (directory, base name). Counters only grow
 * for the lifetime of the instance; seeding from persisted state never lowers them.
 * Not synchronized: the owning engine serializes access.
 */
class NumberingService {
public:
    explicit NumberingService(NumberingConfig config = {});

    /**
     * @brief Returns a path in the same directory that does not exist yet.
     *
     * A recognized numeric suffix on @p path is stripped first, so numbering a
     * numbered file continues its sequence instead of nesting suffixes.
     */
    std::string generate_numbered_name(const std::string& path);

    /**
     * @brief Splits a numbered name into its base name and number.
     * @return (file name without extension, 0) when no suffix is recognized.
     */
    std::pair<std::string, std::uint64_t> parse_numbered_name(const std::string& path) const;

    std::optional<std::uint64_t> highest_issued(const std::string& directory,
                                                const std::string& base_name) const;

    // Raises the counter to at least highest; a lower value leaves it unchanged.
    void seed(const NumberingRecord& record);

    std::vector<NumberingRecord> records() const;
    void clear();

    const NumberingConfig& config() const { return config_; }

private:
    struct CounterState {
        std::uint64_t highest{0};
        int width{0};
        bool scanned{false};
    };
    using Key = std::pair<std::string, std::string>;

    struct ParsedName {
        std::string base_name;
        std::string extension;
        std::optional<std::uint64_t> number;
        int width{0};
    };

    ParsedName split_name(const std::string& file_name) const;
    CounterState scan_directory(const std::string& directory, const std::string& base_name) const;
    std::string format_name(const std::string& base_name, std::uint64_t number,
                            int width, const std::string& extension) const;
    std::uint64_t threshold_for_width(int width) const;

    NumberingConfig config_;
    std::string prefix_;
    std::string separator_;
    std::string closing_;
    std::string trailer_;
    std::regex suffix_pattern_;
    FileScanner scanner_;
    std::map<Key, CounterState> counters_;
};

#endif
