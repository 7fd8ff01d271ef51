#pragma once

#include "core/binding_table.h"
#include "core/sequence_matcher.h"
#include "io/binding_file.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keychord
{
// Key binding engine.
//
// - Holds the derived (in-code) defaults per mode.
// - Loads/saves a user binding file (JSON, schema_version=1); the file entry
//   for an action replaces its default entry wholesale.
// - Builds one immutable BindingTable per mode and feeds keys to an owned
//   SequenceMatcher for the active mode.
//
// A failed load or rebuild leaves every installed table untouched.
class KeyBindingsEngine
{
public:
    KeyBindingsEngine();

    // Defaults for the base mode ("default").
    bool SetDefaults(std::vector<Binding> defaults, std::string& out_error);
    bool SetModeDefaults(const std::string& mode, std::vector<Binding> defaults, std::string& out_error);

    // Missing file: falls back to defaults, returns false with a message.
    bool LoadFromFile(const std::string& path, std::string& out_error);
    bool LoadFromString(const std::string& text, std::string& out_error);
    bool SaveToFile(const std::string& path, std::string& out_error) const;

    // Drops file overrides and rebuilds every mode from defaults.
    bool ResetToDefaults(std::string& out_error);

    // Returns false (and keeps the current mode) if `mode` has no table.
    bool SetMode(const std::string& mode);
    const std::string& Mode() const { return mode_; }
    std::vector<std::string> Modes() const;

    std::shared_ptr<const BindingTable> Table() const;
    std::shared_ptr<const BindingTable> TableFor(const std::string& mode) const;

    MatchOutcome Feed(const KeySpec& key, Clock::time_point now);
    void ResetSequence() { matcher_.Reset(); }
    bool IsSequencePending() const { return matcher_.IsPending(); }

    void SetSequenceTimeout(std::chrono::milliseconds timeout) { matcher_.SetTimeout(timeout); }
    std::chrono::milliseconds SequenceTimeout() const { return matcher_.Timeout(); }

    // True if `key` alone resolves to `action_id` in the active mode.
    // Does not touch the sequence buffer.
    bool ActionPressed(std::string_view action_id, const KeySpec& key) const;

    const std::string& Path() const { return path_; }
    void SetPath(std::string path) { path_ = std::move(path); }

    bool IsLoaded() const { return loaded_; }
    const std::string& LastError() const { return last_error_; }

private:
    struct ModeState
    {
        std::vector<Binding>                defaults;
        std::optional<std::vector<Binding>> file;
        std::shared_ptr<const BindingTable> table;
    };

    using ModeMap = std::map<std::string, ModeState>;

    // Builds tables for every mode in `modes`; on success swaps them in.
    bool Install(ModeMap modes, std::string& out_error);
    bool ApplyFile(const io::BindingModes& file, std::string& out_error);
    bool Fail(std::string message, std::string& out_error);

private:
    std::string path_ = "key-bindings.json";
    bool        loaded_ = false;
    std::string last_error_;

    ModeMap         modes_;
    std::string     mode_ = io::kDefaultMode;
    SequenceMatcher matcher_;
};

} // namespace keychord
