#include <spdlog/spdlog.h>
#ifdef _WIN32
#include <windows.h>
#define RTLD_NOW 0
#define RTLD_LOCAL 0

static void* dlopen(const wchar_t* filename, int) {
    return LoadLibraryW(filename);
}

static void* dlsym(void* handle, const char* symbol) {
    return (void*)GetProcAddress((HMODULE)handle, symbol);
}

static int dlclose(void* handle) {
    return FreeLibrary((HMODULE)handle) ? 0 : -1;
}

static const char* dlerror() {
    static char buf[256];
    DWORD err = GetLastError();
    SetLastError(0);
    if (err == 0)
        return nullptr;
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL, err,
                   MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), buf, sizeof(buf), NULL);
    return buf;
}
#else
#include <dlfcn.h>
#endif

#include <scriptor/plugins/code_unit.h>

namespace scriptor::plugins {

namespace {

// Owns one dlopen handle; closes it on destruction.
class DynamicCodeUnit final : public ICodeUnit {
public:
    DynamicCodeUnit(void* handle, std::string ns, std::filesystem::path path)
        : handle_(handle), namespace_(std::move(ns)), path_(std::move(path)) {}

    ~DynamicCodeUnit() override {
        if (handle_) {
            if (dlclose(handle_) != 0) {
                const char* err = dlerror();
                spdlog::warn("dlclose failed for {}: {}", path_.string(), err ? err : "unknown");
            }
        }
    }

    DynamicCodeUnit(const DynamicCodeUnit&) = delete;
    DynamicCodeUnit& operator=(const DynamicCodeUnit&) = delete;

    const std::string& unitNamespace() const override { return namespace_; }

    std::optional<RegistrationEntry> registrationEntry() const override {
        auto fn = reinterpret_cast<scriptor_plugin_register_fn>(
            lookup(SCRIPTOR_PLUGIN_REGISTER_SYMBOL));
        if (!fn)
            return std::nullopt;
        return RegistrationEntry(fn);
    }

    std::optional<int> abiVersion() const override {
        auto fn = reinterpret_cast<scriptor_plugin_abi_version_fn>(
            lookup(SCRIPTOR_PLUGIN_ABI_VERSION_SYMBOL));
        if (!fn)
            return std::nullopt;
        return fn();
    }

private:
    void* lookup(const char* symbol) const {
        dlerror(); // clear
        void* sym = dlsym(handle_, symbol);
        const char* err = dlerror();
        if (err || !sym) {
            spdlog::debug("[{}] symbol '{}' not exported", namespace_, symbol);
            return nullptr;
        }
        return sym;
    }

    void* handle_{nullptr};
    std::string namespace_;
    std::filesystem::path path_;
};

class DynamicCodeUnitLoader final : public ICodeUnitLoader {
public:
    Result<std::unique_ptr<ICodeUnit>> load(const std::filesystem::path& entrypoint,
                                            const std::string& unitNamespace) override {
        std::error_code ec;
        auto canon = std::filesystem::weakly_canonical(entrypoint, ec);
        if (ec)
            canon = entrypoint;

        // RTLD_LOCAL keeps the plugin's symbols out of the global namespace so two
        // plugins defining the same symbol never resolve against each other.
        void* handle = dlopen(canon.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!handle) {
            const char* err = dlerror();
            return Error{ErrorCode::ExecutionError,
                         std::string("dlopen failed: ") + (err ? err : "unknown")};
        }
        spdlog::debug("Loaded code unit {} from {}", unitNamespace, canon.string());
        std::unique_ptr<ICodeUnit> unit =
            std::make_unique<DynamicCodeUnit>(handle, unitNamespace, canon);
        return Result<std::unique_ptr<ICodeUnit>>(std::move(unit));
    }
};

} // namespace

std::unique_ptr<ICodeUnitLoader> makeDynamicCodeUnitLoader() {
    return std::make_unique<DynamicCodeUnitLoader>();
}

} // namespace scriptor::plugins
