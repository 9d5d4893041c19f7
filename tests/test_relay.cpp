#include "relay.hpp"
#include "sys.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>
#include <unistd.h>

static void test_strip_ansi() {
    assert(strip_ansi("\x1b[31mred\x1b[0m plain") == "red plain");
    assert(strip_ansi("a\x1b[1;32;40mb\x1b[Kc") == "abc");
    assert(strip_ansi("keep\x1b") == "keep\x1b");
    assert(strip_ansi("\x1b[?25lhidden cursor\x1b[?25h") == "hidden cursor");
    assert(strip_ansi("no escapes here\n") == "no escapes here\n");
    // unterminated CSI is left alone
    assert(strip_ansi("\x1b[12") == "\x1b[12");
}

static void test_single_char_escapes() {
    // ESC + one of @..Z or \.._ is dropped with its final byte
    assert(strip_ansi("a\x1b" "Mb") == "ab");
    assert(strip_ansi("a\x1b\\b") == "ab");
    // ESC + digit is not an escape this pattern knows
    assert(strip_ansi("a\x1b" "7b") == "a\x1b" "7b");
}

static void test_decode_lossy() {
    assert(decode_lossy("plain ascii") == "plain ascii");
    assert(decode_lossy("h\xc3\xa9llo") == "h\xc3\xa9llo");
    assert(decode_lossy("a\xff" "b") == "a\xef\xbf\xbd" "b");
    // truncated 3-byte sequence at the end
    assert(decode_lossy("x\xe2\x82") == "x\xef\xbf\xbd");
    // overlong encoding of '/'
    assert(decode_lossy("\xc0\xaf") == "\xef\xbf\xbd\xef\xbf\xbd");
    // surrogate half
    assert(decode_lossy("\xed\xa0\x80") == "\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd");
    assert(decode_lossy("\xf0\x9f\x98\x80") == "\xf0\x9f\x98\x80");
}

static void test_utf8_safe_prefix() {
    assert(utf8_safe_prefix("abc") == 3);
    assert(utf8_safe_prefix("ab\xc3") == 2);
    assert(utf8_safe_prefix("ab\xc3\xa9") == 4);
    assert(utf8_safe_prefix("a\xf0\x9f\x98") == 1);
    assert(utf8_safe_prefix("") == 0);
}

static void test_drain_delivers_in_order() {
    Collector c;
    sys::Pipe p = sys::make_pipe();
    drain(std::move(p.r), [&c](const std::string& s) { c(s); }, "stdout");

    const std::string data = "one\n\x1b[1mtwo\x1b[0m\nbad \xff byte\nno newline";
    assert(sys::write_all(p.w.get(), data.data(), data.size()));
    p.w.reset();

    assert(c.wait_for("no newline"));
    assert(c.text() == "one\ntwo\nbad \xef\xbf\xbd byte\nno newline");
    auto chunks = c.chunks();
    assert(chunks.size() == 4);
    assert(chunks[0] == "one\n");
    assert(chunks[3] == "no newline");
}

static void test_long_line_is_sliced() {
    Collector c;
    sys::Pipe p = sys::make_pipe();
    drain(std::move(p.r), [&c](const std::string& s) { c(s); }, "stdout");

    // 3 bytes per char, so 4 KiB boundaries fall inside characters
    std::string big;
    for (int i = 0; i < 5000; ++i) big += "\xe2\x82\xac";
    big += "|end";
    assert(sys::write_all(p.w.get(), big.data(), big.size()));
    p.w.reset();

    assert(c.wait_for("|end"));
    assert(c.text() == big);
    for (const auto& chunk : c.chunks()) assert(chunk.size() <= 4096 + 4);
    assert(c.chunks().size() > 1);
}

static void test_read_error_reaches_sink() {
    Collector c;
    sys::Pipe p = sys::make_pipe();
    // read(2) on the write end fails with EBADF
    drain(std::move(p.w), [&c](const std::string& s) { c(s); }, "stderr");
    assert(c.wait_for("[relay] stderr read failed:"));
}

int main() {
    quiet_logs();
    test_strip_ansi();
    test_single_char_escapes();
    test_decode_lossy();
    test_utf8_safe_prefix();
    test_drain_delivers_in_order();
    test_long_line_is_sliced();
    test_read_error_reaches_sink();
    return 0;
}
