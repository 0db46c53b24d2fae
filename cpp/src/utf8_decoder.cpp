#include "../include/utf8_decoder.hpp"

namespace ptyshell {
namespace core {

namespace {

constexpr std::string_view kReplacement{"\xEF\xBF\xBD"}; // U+FFFD

// Expected sequence length for a lead byte; 0 if it can never start one.
int sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Second byte ranges exclude overlongs, surrogates and code points > U+10FFFF.
bool valid_second(unsigned char lead, unsigned char b) {
    switch (lead) {
        case 0xE0: return b >= 0xA0 && b <= 0xBF;
        case 0xED: return b >= 0x80 && b <= 0x9F;
        case 0xF0: return b >= 0x90 && b <= 0xBF;
        case 0xF4: return b >= 0x80 && b <= 0x8F;
        default:   return b >= 0x80 && b <= 0xBF;
    }
}

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

} // namespace

std::string Utf8Decoder::feed(std::string_view bytes) {
    std::string in;
    in.reserve(pending_.size() + bytes.size());
    in.append(pending_);
    in.append(bytes.data(), bytes.size());
    pending_.clear();

    std::string out;
    out.reserve(in.size());

    const size_t n = in.size();
    size_t i = 0;
    while (i < n) {
        const auto lead = static_cast<unsigned char>(in[i]);
        const int len = sequence_length(lead);
        if (len == 1) {
            out.push_back(in[i]);
            ++i;
            continue;
        }
        if (len == 0) {
            out.append(kReplacement);
            ++i;
            continue;
        }

        size_t got = 1;
        bool broken = false;
        while (got < static_cast<size_t>(len)) {
            if (i + got >= n) break; // truncated by the chunk boundary
            const auto b = static_cast<unsigned char>(in[i + got]);
            const bool ok = (got == 1) ? valid_second(lead, b) : is_continuation(b);
            if (!ok) { broken = true; break; }
            ++got;
        }

        if (got == static_cast<size_t>(len)) {
            out.append(in, i, got);
            i += got;
        } else if (!broken) {
            pending_.assign(in, i, n - i);
            break;
        } else {
            // Replace the maximal valid prefix, resume at the offending byte.
            out.append(kReplacement);
            i += got;
        }
    }
    return out;
}

std::string Utf8Decoder::flush() {
    if (pending_.empty()) return {};
    pending_.clear();
    return std::string(kReplacement);
}

} // namespace core
} // namespace ptyshell
