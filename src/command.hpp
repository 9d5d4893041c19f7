#pragma once
#include <optional>
#include <string>

namespace Json { class Value; }

enum class CommandKind { Single, Multi, Script };

// "single" / "multi" / "script"
const char* kind_tag(CommandKind k);
std::optional<CommandKind> parse_kind(const std::string& tag);

// A named, persisted definition of one thing to run. Immutable once built.
class Command {
public:
    Command(std::string name, CommandKind kind, std::string content,
            std::string description = {});

    const std::string& name() const { return name_; }
    const std::string& content() const { return content_; }
    const std::string& description() const { return description_; }

    // Raw command_type as stored; unknown tags only come from hand-edited files.
    const std::string& type_tag() const { return type_tag_; }
    std::optional<CommandKind> kind() const { return parse_kind(type_tag_); }

    Json::Value to_json() const;
    // Throws std::runtime_error if the object lacks string fields.
    static Command from_json(const Json::Value& v);

    bool operator==(const Command& o) const;
    bool operator!=(const Command& o) const { return !(*this == o); }

private:
    Command(std::string name, std::string type_tag, std::string content,
            std::string description);

    std::string name_;
    std::string type_tag_;
    std::string content_;
    std::string description_;
};
