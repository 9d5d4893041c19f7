#include "registry.hpp"
#include "test_util.hpp"
#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

static std::vector<std::string> names(const CommandRegistry& r) {
    std::vector<std::string> out;
    for (const auto& c : r.list()) out.push_back(c.name());
    return out;
}

static void fill_abc(CommandRegistry& r) {
    assert(r.add(Command("A", CommandKind::Single, "echo a")));
    assert(r.add(Command("B", CommandKind::Multi, "echo b1\necho b2", "two")));
    assert(r.add(Command("C", CommandKind::Script, "/tmp/c.sh")));
}

static void test_starts_empty_without_file() {
    TempDir td;
    CommandRegistry r(td.path() / "nested" / "dir");
    assert(r.size() == 0);
    assert(r.load_status());
    assert(std::filesystem::is_directory(td.path() / "nested" / "dir"));
    assert(!std::filesystem::exists(r.file()));
}

static void test_round_trip() {
    TempDir td;
    {
        CommandRegistry r(td.path());
        fill_abc(r);
        assert(r.add(Command("Ünïcode", CommandKind::Single, "echo \"héllo\"", "quotes \" and \\")));
    }
    CommandRegistry again(td.path());
    assert(again.load_status());
    assert(again.size() == 4);
    assert(again.list()[1] == Command("B", CommandKind::Multi, "echo b1\necho b2", "two"));
    assert(again.list()[3].content() == "echo \"héllo\"");
    assert(read_file(again.file()).find("\"commands\"") != std::string::npos);
}

static void test_list_is_a_copy() {
    TempDir td;
    CommandRegistry r(td.path());
    fill_abc(r);
    auto snap = r.list();
    snap.clear();
    assert(r.size() == 3);
}

static void test_update_delete() {
    TempDir td;
    CommandRegistry r(td.path());
    fill_abc(r);

    assert(r.update(1, Command("B2", CommandKind::Single, "true")));
    assert(r.size() == 3);
    assert(r.at(1)->name() == "B2");

    assert(r.remove(0));
    assert(r.size() == 2);
    assert((names(r) == std::vector<std::string>{"B2", "C"}));

    CommandRegistry again(td.path());
    assert((names(again) == std::vector<std::string>{"B2", "C"}));
}

static void test_move_semantics() {
    TempDir td;
    CommandRegistry r(td.path());
    fill_abc(r);

    assert(r.move(0, 2));
    assert((names(r) == std::vector<std::string>{"B", "C", "A"}));

    assert(r.move(2, 0));
    assert((names(r) == std::vector<std::string>{"A", "B", "C"}));

    assert(r.move(1, 1));
    assert((names(r) == std::vector<std::string>{"A", "B", "C"}));

    CommandRegistry again(td.path());
    assert((names(again) == std::vector<std::string>{"A", "B", "C"}));
}

static void test_every_valid_index() {
    TempDir td;
    CommandRegistry r(td.path());
    fill_abc(r);
    const long n = static_cast<long>(r.size());
    for (long i = 0; i < n; ++i) {
        assert(r.update(i, Command("X", CommandKind::Single, "true")));
        assert(static_cast<long>(r.size()) == n);
        assert(r.move(i, n - 1 - i));
        assert(static_cast<long>(r.size()) == n);
    }
    for (long i = n - 1; i >= 0; --i) {
        assert(r.remove(i));
        assert(static_cast<long>(r.size()) == i);
    }
}

static void test_out_of_range_is_rejected_without_writing() {
    TempDir td;
    CommandRegistry r(td.path());
    fill_abc(r);

    // If any failing call saved, the file would come back.
    std::filesystem::remove(r.file());

    for (long bad : {-1L, 3L, 100L}) {
        Result u = r.update(bad, Command("Z", CommandKind::Single, "true"));
        assert(!u && *u.error == Error::IndexOutOfRange);
        Result d = r.remove(bad);
        assert(!d && *d.error == Error::IndexOutOfRange);
        Result m1 = r.move(bad, 0);
        assert(!m1 && *m1.error == Error::IndexOutOfRange);
        Result m2 = r.move(0, bad);
        assert(!m2 && *m2.error == Error::IndexOutOfRange);
        assert(!r.at(bad));
    }
    assert((names(r) == std::vector<std::string>{"A", "B", "C"}));
    assert(!std::filesystem::exists(r.file()));
}

static void test_corrupted_document_recovers_empty() {
    TempDir td;
    write_file(td.path() / "commands.json", "{\"commands\": [ {\"name\": \"half");
    CommandRegistry r(td.path());
    assert(r.size() == 0);
    assert(!r.load_status());
    assert(*r.load_status().error == Error::LoadRecoveredEmpty);

    // still usable afterwards
    assert(r.add(Command("fresh", CommandKind::Single, "true")));
    CommandRegistry again(td.path());
    assert(again.size() == 1);
    assert(again.load_status());
}

static void test_wrong_shapes_recover_empty() {
    const char* docs[] = {
        "[]",
        "{\"commands\": {}}",
        "{\"commands\": [ {\"name\": \"a\", \"command_type\": \"single\"} ]}",
        "{\"commands\": [ 7 ]}",
        "\xff\xfe garbage",
        "{\"commands\": [ {\"name\": \"a\", \"command_type\": \"single\", \"content\": \"ls\"} ]} trailing garbage",
        "// comment\n{\"commands\": [ {\"name\": \"a\", \"command_type\": \"single\", \"content\": \"ls\"} ]}",
        "{\"commands\": [ {\"name\": \"a\", \"command_type\": \"single\", \"content\": \"ls\",} ]}",
        "{\"commands\": [ {\"name\": 'a', \"command_type\": \"single\", \"content\": \"ls\"} ]}",
    };
    for (const char* doc : docs) {
        TempDir td;
        write_file(td.path() / "commands.json", doc);
        CommandRegistry r(td.path());
        assert(r.size() == 0);
        assert(*r.load_status().error == Error::LoadRecoveredEmpty);
    }

    TempDir td;
    write_file(td.path() / "commands.json", "{}");
    CommandRegistry r(td.path());
    assert(r.size() == 0);
    assert(r.load_status());
}

static void test_write_failure_keeps_memory() {
    TempDir td;
    // A directory where the document should be makes every write fail.
    std::filesystem::create_directories(td.path() / "commands.json");
    CommandRegistry r(td.path());
    assert(r.size() == 0);

    Result res = r.add(Command("kept", CommandKind::Single, "true"));
    assert(!res && *res.error == Error::PersistenceFailure);
    assert(r.size() == 1);
    assert(r.at(0)->name() == "kept");
}

static void test_failed_save_is_not_logged_as_done() {
    TempDir td;
    std::filesystem::create_directories(td.path() / "commands.json");
    CommandRegistry r(td.path());

    std::ostringstream log;
    diag::set_stream(&log);
    diag::set_level(diag::Level::Info);
    assert(!r.add(Command("kept", CommandKind::Single, "true")));
    assert(!r.update(0, Command("kept2", CommandKind::Single, "true")));
    assert(!r.remove(0));
    diag::set_stream(nullptr);
    quiet_logs();

    assert(log.str().find("Failed to save") != std::string::npos);
    assert(log.str().find("Added command") == std::string::npos);
    assert(log.str().find("Updated command") == std::string::npos);
    assert(log.str().find("Deleted command") == std::string::npos);
}

static void test_unknown_type_round_trips() {
    TempDir td;
    write_file(td.path() / "commands.json",
               "{\"commands\": [ {\"name\": \"odd\", \"command_type\": \"fish\", \"content\": \"ls\"} ]}");
    {
        CommandRegistry r(td.path());
        assert(r.size() == 1);
        assert(!r.at(0)->kind());
        assert(r.add(Command("n", CommandKind::Single, "true")));
    }
    CommandRegistry again(td.path());
    assert(again.at(0)->type_tag() == "fish");
    assert(again.at(0)->description().empty());
}

int main() {
    quiet_logs();
    test_starts_empty_without_file();
    test_round_trip();
    test_list_is_a_copy();
    test_update_delete();
    test_move_semantics();
    test_every_valid_index();
    test_out_of_range_is_rejected_without_writing();
    test_corrupted_document_recovers_empty();
    test_wrong_shapes_recover_empty();
    test_write_failure_keeps_memory();
    test_failed_save_is_not_logged_as_done();
    test_unknown_type_round_trips();
    return 0;
}
