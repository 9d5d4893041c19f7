#include "relay.hpp"
#include "diag.hpp"

#include <cerrno>
#include <thread>
#include <unistd.h>

static constexpr size_t kReadSize = 4096;
static constexpr size_t kMaxPending = 4096;
static const char kReplacement[] = "\xEF\xBF\xBD";

std::string strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] != '\x1B' || i + 1 >= n) { out.push_back(text[i++]); continue; }

        unsigned char c = static_cast<unsigned char>(text[i + 1]);
        if (c == '[') {
            size_t j = i + 2;
            while (j < n && text[j] >= 0x30 && text[j] <= 0x3F) ++j;   // parameters
            while (j < n && text[j] >= 0x20 && text[j] <= 0x2F) ++j;   // intermediates
            if (j < n && text[j] >= 0x40 && text[j] <= 0x7E) { i = j + 1; continue; }
            out.push_back(text[i++]);   // unterminated CSI stays as-is
            continue;
        }
        if ((c >= 0x40 && c <= 0x5A) || (c >= 0x5C && c <= 0x5F)) { i += 2; continue; }

        out.push_back(text[i++]);
    }
    return out;
}

// Expected sequence length for a lead byte and the allowed range of the
// byte after it; 0 for bytes that cannot start a sequence.
static int lead_info(unsigned char b, unsigned char& lo, unsigned char& hi) {
    lo = 0x80; hi = 0xBF;
    if (b < 0x80) return 1;
    if (b >= 0xC2 && b <= 0xDF) return 2;
    if (b == 0xE0) { lo = 0xA0; return 3; }
    if (b == 0xED) { hi = 0x9F; return 3; }
    if (b >= 0xE1 && b <= 0xEF) return 3;
    if (b == 0xF0) { lo = 0x90; return 4; }
    if (b >= 0xF1 && b <= 0xF3) return 4;
    if (b == 0xF4) { hi = 0x8F; return 4; }
    return 0;
}

std::string decode_lossy(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lo, hi;
        int need = lead_info(static_cast<unsigned char>(bytes[i]), lo, hi);
        if (need == 1) { out.push_back(bytes[i++]); continue; }
        if (need == 0) { out += kReplacement; ++i; continue; }

        int got = 1;
        while (got < need && i + got < bytes.size()) {
            unsigned char c = static_cast<unsigned char>(bytes[i + got]);
            unsigned char l = (got == 1) ? lo : 0x80;
            unsigned char h = (got == 1) ? hi : 0xBF;
            if (c < l || c > h) break;
            ++got;
        }
        if (got == need) out.append(bytes.data() + i, static_cast<size_t>(need));
        else out += kReplacement;
        i += static_cast<size_t>(got);
    }
    return out;
}

size_t utf8_safe_prefix(std::string_view bytes) {
    const size_t n = bytes.size();
    for (size_t back = 1; back <= 3 && back <= n; ++back) {
        unsigned char b = static_cast<unsigned char>(bytes[n - back]);
        if ((b & 0xC0) == 0x80) continue;   // continuation, keep looking for the lead
        unsigned char lo, hi;
        int need = lead_info(b, lo, hi);
        if (need > 1 && static_cast<size_t>(need) > back) return n - back;
        return n;
    }
    return n;
}

namespace {

void deliver(const Sink& sink, std::string_view raw) {
    if (raw.empty()) return;
    sink(strip_ansi(decode_lossy(raw)));
}

void drain_loop(int fd, const Sink& sink, const std::string& name) {
    std::string pending;
    char buf[kReadSize];

    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof buf);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            deliver(sink, pending);
            sink("[relay] " + name + " read failed: " + sys::errno_text(err) + "\n");
            return;
        }
        if (n == 0) break;

        pending.append(buf, static_cast<size_t>(n));

        size_t start = 0;
        for (size_t nl; (nl = pending.find('\n', start)) != std::string::npos; start = nl + 1) {
            deliver(sink, std::string_view(pending).substr(start, nl + 1 - start));
        }
        pending.erase(0, start);

        if (pending.size() >= kMaxPending) {
            size_t cut = utf8_safe_prefix(pending);
            if (cut == 0) cut = pending.size();
            deliver(sink, std::string_view(pending).substr(0, cut));
            pending.erase(0, cut);
        }
    }

    deliver(sink, pending);
}

} // namespace

void drain(sys::Fd fd, Sink sink, std::string stream_name) {
    std::thread([fd = std::move(fd), sink = std::move(sink), name = std::move(stream_name)]() {
        try {
            drain_loop(fd.get(), sink, name);
        } catch (const std::exception& e) {
            diag::error("relay", name + " sink threw: " + e.what());
        }
    }).detach();
}
