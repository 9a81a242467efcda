#include "flbplug/plugin_loader.h"
#include "flbplug/config.h"

#include <dlfcn.h>

namespace flbplug {

static const char* MODULE_PREFIX = "flb-in_";
static const char* MODULE_SUFFIX = ".so";

PluginManager::PluginManager() : abi_lax_(abi_lax_from_env()) {}

PluginManager::~PluginManager() {
    for (auto& h : handles_) {
        if (!h.handle) continue;
        dlclose(h.handle);
        h.handle = nullptr;
    }
    handles_.clear();
    loaded_.clear();
}

static std::string canonical_str(const std::filesystem::path& p) {
    std::error_code ec;
    auto c = std::filesystem::weakly_canonical(p, ec);
    if (!ec) return c.string();
    auto a = std::filesystem::absolute(p, ec);
    return ec ? p.string() : a.string();
}

std::string PluginManager::module_file_name(const std::string& name) {
    return MODULE_PREFIX + name + MODULE_SUFFIX;
}

std::string PluginManager::descriptor_symbol(const std::string& name) {
    return "in_" + name + "_plugin";
}

std::optional<std::string> PluginManager::name_from_path(const std::filesystem::path& path) {
    const std::string file = path.filename().string();
    const std::string prefix(MODULE_PREFIX);
    const std::string suffix(MODULE_SUFFIX);
    if (file.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (file.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;
    return file.substr(prefix.size(), file.size() - prefix.size() - suffix.size());
}

bool PluginManager::is_loaded(const std::filesystem::path& path) const {
    return loaded_.count(canonical_str(path)) != 0;
}

const flbplug_input_plugin* PluginManager::load_plugin(const std::filesystem::path& path,
                                                       std::string* err) {
    auto canonical = canonical_str(path);
    if (loaded_.count(canonical)) {
        for (const auto& h : handles_) {
            if (h.canonical == canonical) return h.desc;
        }
    }

    auto name = name_from_path(path);
    if (!name) {
        if (err) *err = "plugin file name must look like " + module_file_name("<name>")
                      + ": " + path.string();
        return nullptr;
    }

    if (!std::filesystem::exists(path)) {
        if (err) *err = "plugin not found: " + path.string();
        return nullptr;
    }

    // dlopen only searches the library path for names without a slash, so
    // always hand it the resolved path.
    void* h = dlopen(canonical.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // call once, dlerror() clears on read
        if (err) *err = std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)");
        return nullptr;
    }

    // ABI version check
    dlerror(); // clear
    auto abi_fn = reinterpret_cast<flbplug_abi_version_fn>(dlsym(h, "flbplug_abi_version"));
    dlerror(); // clear, check result instead
    if (abi_fn) {
        int plugin_abi = abi_fn();
        if (plugin_abi != FLBPLUG_ABI_VERSION) {
            if (err) *err = "ABI version mismatch: host=" + std::to_string(FLBPLUG_ABI_VERSION)
                          + " plugin=" + std::to_string(plugin_abi)
                          + " for " + path.string();
            dlclose(h);
            return nullptr;
        }
    } else if (!abi_lax_) {
        if (err) *err = "plugin missing flbplug_abi_version() export: " + path.string()
                      + " (set FLBPLUG_PLUGIN_ABI_LAX=1 to allow)";
        dlclose(h);
        return nullptr;
    }

    const std::string sym = descriptor_symbol(*name);
    dlerror(); // clear
    auto* desc = static_cast<const flbplug_input_plugin*>(dlsym(h, sym.c_str()));
    const char* sym_err = dlerror();
    if (sym_err != nullptr || !desc) {
        if (err) *err = "dlsym(" + sym + ") failed: " + (sym_err ? sym_err : "(null)");
        dlclose(h);
        return nullptr;
    }

    if (!desc->name || *name != desc->name) {
        if (err) *err = "descriptor name '" + std::string(desc->name ? desc->name : "(null)")
                      + "' does not match module name '" + *name + "'";
        dlclose(h);
        return nullptr;
    }
    if (!desc->cb_init) {
        if (err) *err = "descriptor " + sym + " has no cb_init";
        dlclose(h);
        return nullptr;
    }

    handles_.push_back({canonical, h, desc});
    loaded_.insert(canonical);
    return desc;
}

const flbplug_input_plugin* PluginManager::load_by_name(const std::string& name,
                                                        const std::filesystem::path& dir,
                                                        std::string* err) {
    if (name.empty() || name.find('/') != std::string::npos) {
        if (err) *err = "invalid plugin name: '" + name + "'";
        return nullptr;
    }
    return load_plugin(dir / module_file_name(name), err);
}

} // namespace flbplug
