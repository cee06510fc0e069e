// =================================================================
// src/DirDump/SplitWriter.cpp
// =================================================================
// Implementation for size-bounded output writing with numbered part files.

#include "DirDump/SplitWriter.hpp"
#include "DirDump/Errors.hpp"
#include "DirDump/Logger.hpp"
#include <iomanip>
#include <sstream>
#include <system_error>

namespace DirDump {

SplitWriter::SplitWriter(const std::filesystem::path& output_path, size_t budget_bytes)
    : m_output_path(output_path),
      m_budget_bytes(budget_bytes),
      m_state(State::Single),
      m_current_bytes(0),
      m_part_index(1) {
    openPart(m_output_path);
    m_parts.push_back(m_output_path);
}

SplitWriter::~SplitWriter() {
    if (m_stream.is_open()) {
        m_stream.close();
    }
}

void SplitWriter::write(const std::string& text) {
    if (m_state == State::Closed) {
        throw OutputWriteError("Write after close: " + m_output_path.string());
    }

    if (wouldOverflow(m_current_bytes, text.size(), m_budget_bytes)) {
        rotate();
    }

    writeRaw(text);
}

void SplitWriter::close() {
    if (m_state == State::Closed) {
        return;
    }
    m_state = State::Closed;

    m_stream.flush();
    bool ok = static_cast<bool>(m_stream);
    m_stream.close();
    if (!ok || m_stream.fail()) {
        throw OutputWriteError("Failed to finish writing " + m_parts.back().string());
    }
}

bool SplitWriter::wouldOverflow(size_t current_bytes, size_t next_bytes, size_t budget_bytes) {
    if (budget_bytes == 0 || current_bytes == 0) {
        return false;
    }
    return current_bytes + next_bytes > budget_bytes;
}

std::filesystem::path SplitWriter::partPath(const std::filesystem::path& output_path, size_t index) {
    std::ostringstream name;
    name << output_path.stem().string() << "_"
         << std::setw(3) << std::setfill('0') << index
         << output_path.extension().string();
    return output_path.parent_path() / name.str();
}

const std::string& SplitWriter::getContinuationMarker() {
    static const std::string marker = "（続き）\n\n";
    return marker;
}

void SplitWriter::rotate() {
    m_stream.close();
    if (m_stream.fail()) {
        throw OutputWriteError("Failed to close " + m_parts.back().string());
    }

    if (m_state == State::Single) {
        std::filesystem::path first_part = partPath(m_output_path, 1);
        std::error_code ec;
        std::filesystem::rename(m_output_path, first_part, ec);
        if (ec) {
            throw OutputWriteError("Cannot rename " + m_output_path.string() +
                                   " to " + first_part.string() + ": " + ec.message());
        }
        m_parts.back() = first_part;
        m_state = State::Splitting;
        LOG_INFO("SplitWriter", "Output exceeds budget, splitting into parts");
    }

    m_part_index++;
    std::filesystem::path next_part = partPath(m_output_path, m_part_index);
    openPart(next_part);
    m_parts.push_back(next_part);
    m_current_bytes = 0;

    LOG_DEBUG("SplitWriter", "Started part " + next_part.string());
    writeRaw(getContinuationMarker());
}

void SplitWriter::openPart(const std::filesystem::path& path) {
    m_stream.clear();
    m_stream.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!m_stream.is_open()) {
        throw OutputWriteError("Cannot open output file: " + path.string());
    }
}

void SplitWriter::writeRaw(const std::string& text) {
    m_stream.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!m_stream) {
        throw OutputWriteError("Failed to write " + m_parts.back().string());
    }
    m_current_bytes += text.size();
}

// SelfExclusion implementation

SelfExclusion::SelfExclusion(const std::filesystem::path& output_path)
    : m_output_path(normalize(output_path)) {
    std::string pattern = "^" + escapeRegex(output_path.stem().string()) +
                          "_[0-9]{3}" + escapeRegex(output_path.extension().string()) + "$";
    m_pattern = std::regex(pattern, std::regex_constants::ECMAScript);
}

bool SelfExclusion::matches(const std::filesystem::path& candidate) const {
    if (std::regex_match(candidate.filename().string(), m_pattern)) {
        return true;
    }

    return normalize(candidate) == m_output_path;
}

std::string SelfExclusion::escapeRegex(const std::string& str) {
    std::string result;
    for (char c : str) {
        if (c == '.' || c == '^' || c == '$' || c == '+' || c == '*' || c == '?' ||
            c == '{' || c == '}' || c == '|' || c == '(' || c == ')' ||
            c == '[' || c == ']' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::filesystem::path SelfExclusion::normalize(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return resolved;
}

} // namespace DirDump
