//! # Charset Conversion
//!
//! iconv-backed implementation of `decode()` and `encode()`. A converter
//! handle is opened per call; files are converted in one pass with an
//! output buffer that grows on E2BIG.

#include "charset/charset.hpp"

#include <cerrno>
#include <cstring>
#include <iconv.h>

namespace srcfmt::charset {

namespace {

/// RAII wrapper around an iconv_t descriptor.
class Converter {
public:
    Converter(const std::string& to, const std::string& from)
        : cd_(iconv_open(to.c_str(), from.c_str())) {}

    ~Converter() {
        if (valid()) {
            iconv_close(cd_);
        }
    }

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    bool valid() const {
        return cd_ != reinterpret_cast<iconv_t>(-1);
    }

    iconv_t get() const {
        return cd_;
    }

private:
    iconv_t cd_;
};

Result<std::string, EncodingError> convert(std::string_view input, const std::string& from,
                                           const std::string& to, const std::string& reported) {
    Converter conv(to, from);
    if (!conv.valid()) {
        return EncodingError{reported, 0, "unsupported charset"};
    }

    std::string output;
    output.resize(input.size() * 2 + 16);

    // iconv takes non-const input pointers on some platforms
    char* in_ptr = const_cast<char*>(input.data());
    size_t in_left = input.size();
    size_t out_used = 0;

    while (in_left > 0) {
        char* out_ptr = output.data() + out_used;
        size_t out_left = output.size() - out_used;
        size_t rc = iconv(conv.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        out_used = output.size() - out_left;
        if (rc != static_cast<size_t>(-1)) {
            continue;
        }

        size_t offset = static_cast<size_t>(in_ptr - input.data());
        switch (errno) {
        case E2BIG:
            output.resize(output.size() * 2);
            break;
        case EILSEQ:
            return EncodingError{reported, offset, "invalid or unconvertible sequence"};
        case EINVAL:
            return EncodingError{reported, offset, "incomplete byte sequence at end of input"};
        default:
            return EncodingError{reported, offset, std::strerror(errno)};
        }
    }

    // Emit any trailing shift sequence (stateful encodings such as ISO-2022).
    while (true) {
        char* out_ptr = output.data() + out_used;
        size_t out_left = output.size() - out_used;
        size_t rc = iconv(conv.get(), nullptr, nullptr, &out_ptr, &out_left);
        out_used = output.size() - out_left;
        if (rc != static_cast<size_t>(-1)) {
            break;
        }
        if (errno != E2BIG) {
            return EncodingError{reported, input.size(), std::strerror(errno)};
        }
        output.resize(output.size() * 2);
    }

    output.resize(out_used);
    return output;
}

} // namespace

bool is_supported(const std::string& charset) {
    if (charset.empty())
        return false;
    Converter to_utf8("UTF-8", charset);
    Converter from_utf8(charset, "UTF-8");
    return to_utf8.valid() && from_utf8.valid();
}

Result<std::string, EncodingError> decode(std::string_view bytes, const std::string& charset) {
    return convert(bytes, charset, "UTF-8", charset);
}

Result<std::string, EncodingError> encode(std::string_view text, const std::string& charset) {
    return convert(text, "UTF-8", charset, charset);
}

} // namespace srcfmt::charset
