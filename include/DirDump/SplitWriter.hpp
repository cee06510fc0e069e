// =================================================================
// include/DirDump/SplitWriter.hpp
// =================================================================
// Header for size-bounded output writing with numbered part files.

#pragma once

#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <vector>

namespace DirDump {

/**
 * @brief Output sink that rotates into numbered part files
 *
 * States: Single (writing the original output path), Splitting (the
 * original was renamed to <stem>_001<suffix> and writes go to later parts),
 * Closed. A write that would push a non-empty part over the budget first
 * rotates; a single write is never split, so one oversized write may exceed
 * the budget.
 */
class SplitWriter {
public:
    enum class State {
        Single,
        Splitting,
        Closed
    };

    /**
     * @brief Open the output path for writing (truncating it)
     * @param output_path Final output path of the dump
     * @param budget_bytes Maximum bytes per part, 0 disables splitting
     * @throws OutputWriteError if the file cannot be opened
     */
    explicit SplitWriter(const std::filesystem::path& output_path, size_t budget_bytes = 0);

    ~SplitWriter();

    SplitWriter(const SplitWriter&) = delete;
    SplitWriter& operator=(const SplitWriter&) = delete;

    /**
     * @brief Append text, rotating first if the budget requires it
     * @throws OutputWriteError on I/O failure or after close()
     */
    void write(const std::string& text);

    /**
     * @brief Flush and close the active part. Safe to call more than once.
     * @throws OutputWriteError if the final flush fails
     */
    void close();

    State getState() const { return m_state; }

    /**
     * @brief Every part written so far, in emission order
     */
    const std::vector<std::filesystem::path>& getParts() const { return m_parts; }

    size_t getCurrentBytes() const { return m_current_bytes; }

    /**
     * @brief Rotation predicate
     * @return true if budget is set, the part already holds bytes and
     *         adding next_bytes would exceed the budget
     */
    static bool wouldOverflow(size_t current_bytes, size_t next_bytes, size_t budget_bytes);

    /**
     * @brief Path of part `index` (1-based): <stem>_NNN<suffix> beside the output
     */
    static std::filesystem::path partPath(const std::filesystem::path& output_path, size_t index);

    /**
     * @brief First content of every continuation part
     */
    static const std::string& getContinuationMarker();

private:
    std::filesystem::path m_output_path;
    size_t m_budget_bytes;
    std::ofstream m_stream;
    State m_state;
    size_t m_current_bytes;
    size_t m_part_index;
    std::vector<std::filesystem::path> m_parts;

    void rotate();
    void openPart(const std::filesystem::path& path);
    void writeRaw(const std::string& text);
};

/**
 * @brief Recognizes files produced by this dump's output
 *
 * Matches the output path itself and any <stem>_NNN<suffix> name, which
 * covers every part a SplitWriter emits for that output.
 */
class SelfExclusion {
public:
    explicit SelfExclusion(const std::filesystem::path& output_path);

    /**
     * @brief Check whether a candidate is dump output
     * @param candidate Absolute path of a collected file
     */
    bool matches(const std::filesystem::path& candidate) const;

private:
    std::filesystem::path m_output_path;
    std::regex m_pattern;

    static std::string escapeRegex(const std::string& str);
    static std::filesystem::path normalize(const std::filesystem::path& path);
};

} // namespace DirDump
