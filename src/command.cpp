#include "command.hpp"

#include <json/json.h>
#include <stdexcept>
#include <utility>

const char* kind_tag(CommandKind k) {
    switch (k) {
    case CommandKind::Single: return "single";
    case CommandKind::Multi:  return "multi";
    case CommandKind::Script: return "script";
    }
    return "single";
}

std::optional<CommandKind> parse_kind(const std::string& tag) {
    if (tag == "single") return CommandKind::Single;
    if (tag == "multi")  return CommandKind::Multi;
    if (tag == "script") return CommandKind::Script;
    return std::nullopt;
}

Command::Command(std::string name, CommandKind kind, std::string content,
                 std::string description)
    : Command(std::move(name), std::string(kind_tag(kind)), std::move(content),
              std::move(description)) {}

Command::Command(std::string name, std::string type_tag, std::string content,
                 std::string description)
    : name_(std::move(name)),
      type_tag_(std::move(type_tag)),
      content_(std::move(content)),
      description_(std::move(description)) {}

Json::Value Command::to_json() const {
    Json::Value v(Json::objectValue);
    v["name"] = name_;
    v["command_type"] = type_tag_;
    v["content"] = content_;
    v["description"] = description_;
    return v;
}

static std::string string_field(const Json::Value& v, const char* key, bool required) {
    const Json::Value& f = v[key];
    if (f.isNull() && !required) return {};
    if (!f.isString()) {
        throw std::runtime_error(std::string("field '") + key + "' missing or not a string");
    }
    return f.asString();
}

Command Command::from_json(const Json::Value& v) {
    if (!v.isObject()) throw std::runtime_error("command entry is not an object");
    return Command(string_field(v, "name", true),
                   string_field(v, "command_type", true),
                   string_field(v, "content", true),
                   string_field(v, "description", false));
}

bool Command::operator==(const Command& o) const {
    return name_ == o.name_ && type_tag_ == o.type_tag_ &&
           content_ == o.content_ && description_ == o.description_;
}
