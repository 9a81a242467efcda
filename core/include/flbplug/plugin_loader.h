#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "flbplug/plugin_api.h"

namespace flbplug {

// Loads shared objects that export an input descriptor following the
// flb-in_<name>.so / in_<name>_plugin convention.
// Keeps handles alive until the manager is destroyed.
class PluginManager {
public:
    PluginManager();
    ~PluginManager();

    // "example" -> "flb-in_example.so"
    static std::string module_file_name(const std::string& name);
    // "example" -> "in_example_plugin"
    static std::string descriptor_symbol(const std::string& name);
    // ".../flb-in_example.so" -> "example"; nullopt when the file name does
    // not follow the convention.
    static std::optional<std::string> name_from_path(const std::filesystem::path& path);

    // Load one module. Returns its descriptor, or nullptr (err filled).
    // Loading the same file twice returns the descriptor already loaded.
    const flbplug_input_plugin* load_plugin(const std::filesystem::path& path,
                                            std::string* err);

    // Resolve name to dir/flb-in_<name>.so and load it.
    const flbplug_input_plugin* load_by_name(const std::string& name,
                                             const std::filesystem::path& dir,
                                             std::string* err);

    bool is_loaded(const std::filesystem::path& path) const;
    size_t loaded_count() const { return handles_.size(); }

    // Accept modules without flbplug_abi_version(). Default: from
    // FLBPLUG_PLUGIN_ABI_LAX.
    void set_abi_lax(bool lax) { abi_lax_ = lax; }

private:
    struct Handle {
        std::string canonical;
        void* handle{nullptr};
        const flbplug_input_plugin* desc{nullptr};
    };

    std::vector<Handle> handles_;
    std::unordered_set<std::string> loaded_;
    bool abi_lax_;
};

} // namespace flbplug
