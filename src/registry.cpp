#include "registry.hpp"
#include "config.hpp"
#include "diag.hpp"

#include <fstream>
#include <json/json.h>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

static constexpr const char* TAG = "registry";

CommandRegistry::CommandRegistry(fs::path dir)
    : dir_(std::move(dir)), file_(config::commands_file(dir_)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) diag::error(TAG, "cannot create " + dir_.string() + ": " + ec.message());
    load();
}

Result CommandRegistry::load() {
    commands_.clear();

    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        diag::info(TAG, "No existing commands file found, starting fresh");
        load_status_ = Result::success();
        return load_status_;
    }

    try {
        std::ifstream in(file_, std::ios::binary);
        if (!in) throw std::runtime_error("cannot open for reading");

        Json::CharReaderBuilder rb;
        Json::CharReaderBuilder::strictMode(&rb.settings_);
        rb["allowTrailingCommas"] = false;
        rb["collectComments"] = false;
        Json::Value root;
        std::string errs;
        if (!Json::parseFromStream(rb, in, &root, &errs)) throw std::runtime_error(errs);
        if (!root.isObject()) throw std::runtime_error("top level is not an object");

        const Json::Value& arr = root["commands"];
        if (!arr.isNull() && !arr.isArray()) throw std::runtime_error("'commands' is not an array");

        std::vector<Command> loaded;
        for (const auto& item : arr) loaded.push_back(Command::from_json(item));
        commands_ = std::move(loaded);
    } catch (const std::exception& e) {
        commands_.clear();
        diag::error(TAG, "Failed to load commands from " + file_.string() + ": " + e.what());
        load_status_ = Result::failure(Error::LoadRecoveredEmpty, e.what());
        return load_status_;
    }

    diag::info(TAG, "Loaded " + std::to_string(commands_.size()) + " commands from storage");
    load_status_ = Result::success();
    return load_status_;
}

Result CommandRegistry::save() const {
    Json::Value root(Json::objectValue);
    Json::Value arr(Json::arrayValue);
    for (const auto& c : commands_) arr.append(c.to_json());
    root["commands"] = arr;

    Json::StreamWriterBuilder wb;
    wb["indentation"] = "  ";
    wb["emitUTF8"] = true;

    std::ofstream out(file_, std::ios::binary | std::ios::trunc);
    if (out) {
        std::unique_ptr<Json::StreamWriter> w(wb.newStreamWriter());
        w->write(root, &out);
        out << "\n";
        out.flush();
    }
    if (!out) {
        std::string msg = "Failed to save commands to " + file_.string();
        diag::error(TAG, msg);
        return Result::failure(Error::PersistenceFailure, msg);
    }

    diag::info(TAG, "Saved " + std::to_string(commands_.size()) + " commands to storage");
    return Result::success();
}

std::optional<Command> CommandRegistry::at(long index) const {
    if (!in_range(index)) return std::nullopt;
    return commands_[static_cast<size_t>(index)];
}

bool CommandRegistry::in_range(long index) const {
    return index >= 0 && static_cast<size_t>(index) < commands_.size();
}

Result CommandRegistry::out_of_range(long index) const {
    std::string msg = "Invalid command index: " + std::to_string(index) +
                      " (have " + std::to_string(commands_.size()) + ")";
    diag::error(TAG, msg);
    return Result::failure(Error::IndexOutOfRange, msg);
}

Result CommandRegistry::add(Command cmd) {
    std::string name = cmd.name();
    commands_.push_back(std::move(cmd));
    Result r = save();
    if (r) diag::info(TAG, "Added command: " + name);
    return r;
}

Result CommandRegistry::update(long index, Command cmd) {
    if (!in_range(index)) return out_of_range(index);
    std::string name = cmd.name();
    commands_[static_cast<size_t>(index)] = std::move(cmd);
    Result r = save();
    if (r) diag::info(TAG, "Updated command at index " + std::to_string(index) + ": " + name);
    return r;
}

Result CommandRegistry::remove(long index) {
    if (!in_range(index)) return out_of_range(index);
    auto it = commands_.begin() + index;
    std::string name = it->name();
    commands_.erase(it);
    Result r = save();
    if (r) diag::info(TAG, "Deleted command: " + name);
    return r;
}

Result CommandRegistry::move(long from, long to) {
    if (!in_range(from) || !in_range(to)) {
        std::string msg = "Invalid move indices: " + std::to_string(from) + " -> " +
                          std::to_string(to);
        diag::error(TAG, msg);
        return Result::failure(Error::IndexOutOfRange, msg);
    }
    Command c = commands_[static_cast<size_t>(from)];
    commands_.erase(commands_.begin() + from);
    commands_.insert(commands_.begin() + to, std::move(c));
    Result r = save();
    if (r) diag::info(TAG, "Moved command from index " + std::to_string(from) + " to " + std::to_string(to));
    return r;
}
