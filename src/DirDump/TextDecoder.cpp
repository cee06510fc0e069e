// =================================================================
// src/DirDump/TextDecoder.cpp
// =================================================================
// Implementation for decoding raw file bytes into UTF-8 text.

#include "DirDump/TextDecoder.hpp"
#include <cerrno>
#include <iconv.h>
#include <vector>

namespace DirDump {

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD";
const char kUtf8Bom[] = "\xEF\xBB\xBF";

/**
 * @brief Scan one UTF-8 sequence starting at data[pos]
 * @param consumed Length of the valid sequence, or of the maximal invalid
 *                 subpart (at least 1) when the sequence is invalid
 * @return true if a complete, well-formed sequence was found
 */
bool scanSequence(const unsigned char* data, size_t size, size_t pos, size_t& consumed) {
    unsigned char lead = data[pos];
    consumed = 1;

    if (lead < 0x80) {
        return true;
    }

    size_t length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        lower = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        length = 3;
    } else if (lead == 0xED) {
        length = 3;
        upper = 0x9F;   // no surrogates
    } else if (lead == 0xF0) {
        length = 4;
        lower = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4;
        upper = 0x8F;
    } else {
        return false;
    }

    for (size_t i = 1; i < length; ++i) {
        if (pos + i >= size) {
            return false;
        }
        unsigned char c = data[pos + i];
        unsigned char lo = (i == 1) ? lower : 0x80;
        unsigned char hi = (i == 1) ? upper : 0xBF;
        if (c < lo || c > hi) {
            return false;
        }
        consumed = i + 1;
    }

    return true;
}

const iconv_t kInvalidIconv = reinterpret_cast<iconv_t>(-1);

struct IconvHandle {
    iconv_t cd;
    explicit IconvHandle(iconv_t handle) : cd(handle) {}
    ~IconvHandle() {
        if (cd != kInvalidIconv) {
            iconv_close(cd);
        }
    }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;
};

} // namespace

DecodedText TextDecoder::decode(const std::string& bytes) {
    if (bytes.compare(0, 3, kUtf8Bom) == 0) {
        std::string body = bytes.substr(3);
        if (isValidUtf8(body)) {
            return DecodedText(std::move(body), TextEncoding::Utf8Bom);
        }
    } else if (isValidUtf8(bytes)) {
        return DecodedText(bytes, TextEncoding::Utf8);
    }

    std::string converted;
    if (decodeCp932(bytes, converted)) {
        return DecodedText(std::move(converted), TextEncoding::Cp932);
    }

    return DecodedText(decodeUtf8Lossy(bytes), TextEncoding::Utf8Lossy);
}

bool TextDecoder::isValidUtf8(const std::string& bytes) {
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t consumed = 0;
        if (!scanSequence(data, bytes.size(), pos, consumed)) {
            return false;
        }
        pos += consumed;
    }
    return true;
}

bool TextDecoder::decodeCp932(const std::string& bytes, std::string& out) {
    IconvHandle handle(iconv_open("UTF-8", "CP932"));
    if (handle.cd == kInvalidIconv) {
        return false;
    }

    std::vector<char> input(bytes.begin(), bytes.end());
    char* in_ptr = input.data();
    size_t in_left = input.size();

    // CP932 expands to at most 3 UTF-8 bytes per input byte
    std::vector<char> output(input.size() * 3 + 16);
    char* out_ptr = output.data();
    size_t out_left = output.size();

    while (in_left > 0) {
        size_t result = iconv(handle.cd, &in_ptr, &in_left, &out_ptr, &out_left);
        if (result != static_cast<size_t>(-1)) {
            break;
        }
        if (errno != E2BIG) {
            return false;   // EILSEQ or EINVAL: not CP932
        }
        size_t used = output.size() - out_left;
        output.resize(output.size() * 2);
        out_ptr = output.data() + used;
        out_left = output.size() - used;
    }

    if (iconv(handle.cd, nullptr, nullptr, &out_ptr, &out_left) == static_cast<size_t>(-1)) {
        return false;
    }

    out.assign(output.data(), output.size() - out_left);
    return true;
}

std::string TextDecoder::decodeUtf8Lossy(const std::string& bytes) {
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    std::string result;
    result.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t consumed = 0;
        if (scanSequence(data, bytes.size(), pos, consumed)) {
            result.append(bytes, pos, consumed);
        } else {
            result += kReplacementChar;
        }
        pos += consumed;
    }

    return result;
}

std::string TextDecoder::getEncodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8: return "utf-8";
        case TextEncoding::Utf8Bom: return "utf-8-sig";
        case TextEncoding::Cp932: return "cp932";
        case TextEncoding::Utf8Lossy: return "utf-8 (replace)";
        default: return "unknown";
    }
}

} // namespace DirDump
