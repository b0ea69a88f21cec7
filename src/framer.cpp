// ============================================================================
// framer.cpp: implementation for framer.hpp
// For the framing rules see the matching .hpp. Behavior is pinned by
// tests/test_framer.cpp.
// ============================================================================

/**
 * @file framer.cpp
 */

#include "serialhub/framer.hpp"

namespace serialhub {

// ---------------------------------------------------------------------------
// is_space()
// ----------
// ASCII whitespace only. std::isspace depends on the C locale and is UB for
// negative chars, neither of which we want on raw device bytes.
// ---------------------------------------------------------------------------
static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

static std::string trim(const std::string& s, std::size_t begin, std::size_t end) {
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}


// ---------------------------------------------------------------------------
// scan_utf8()
// -----------
// Table-free validator following the well-formed byte sequences of
// Unicode 15, table 3-7. The first continuation byte carries the tighter
// ranges (E0, ED, F0, F4 leads); later continuations are plain 80..BF.
// ---------------------------------------------------------------------------
bool scan_utf8(const std::string& data, std::size_t& complete) {
    const std::size_t n = data.size();
    std::size_t i = 0;

    while (i < n) {
        const auto lead = static_cast<unsigned char>(data[i]);
        if (lead < 0x80) { ++i; continue; }

        std::size_t   need = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // allowed range of first continuation

        if      (lead >= 0xC2 && lead <= 0xDF) need = 1;
        else if (lead == 0xE0)                 { need = 2; lo = 0xA0; }
        else if (lead >= 0xE1 && lead <= 0xEC) need = 2;
        else if (lead == 0xED)                 { need = 2; hi = 0x9F; }  // no surrogates
        else if (lead >= 0xEE && lead <= 0xEF) need = 2;
        else if (lead == 0xF0)                 { need = 3; lo = 0x90; }
        else if (lead >= 0xF1 && lead <= 0xF3) need = 3;
        else if (lead == 0xF4)                 { need = 3; hi = 0x8F; }  // <= U+10FFFF
        else return false;                     // 80..C1, F5..FF never lead

        for (std::size_t k = 1; k <= need; ++k) {
            if (i + k >= n) {                  // sequence runs off the chunk
                complete = i;
                return true;
            }
            const auto cont = static_cast<unsigned char>(data[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            if (cont < min || cont > max) return false;
        }
        i += need + 1;
    }

    complete = n;
    return true;
}


// ---------------------------------------------------------------------------
// LineFramer::feed()
// ------------------
// 1) prepend the carried tail and validate the whole chunk,
// 2) move the complete code points into the line buffer,
// 3) cut at every delimiter, trim, emit non-empty lines,
// 4) keep the remainder for the next call.
// ---------------------------------------------------------------------------
LineFramer::FeedResult LineFramer::feed(const uint8_t* data, std::size_t len,
                                        std::vector<std::string>& out) {
    std::string chunk = carry_;
    chunk.append(reinterpret_cast<const char*>(data), len);

    std::size_t complete = 0;
    if (!scan_utf8(chunk, complete)) {
        carry_.clear();                  // the carried prefix belonged to the bad chunk
        return FeedResult::InvalidUtf8;
    }

    line_.append(chunk, 0, complete);
    carry_.assign(chunk, complete, std::string::npos);

    std::size_t start = 0;
    for (;;) {
        const std::size_t eol = line_.find(DELIMITER, start);
        if (eol == std::string::npos) break;
        std::string msg = trim(line_, start, eol);
        if (!msg.empty()) out.push_back(std::move(msg));
        start = eol + 1;
    }
    if (start > 0) line_.erase(0, start);

    return FeedResult::Ok;
}

LineFramer::FeedResult LineFramer::feed(const std::string& chunk, std::vector<std::string>& out) {
    return feed(reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size(), out);
}

void LineFramer::reset() {
    line_.clear();
    carry_.clear();
}

} // namespace serialhub
