// nativebridge kernel: memoized native library loader and typed symbol binding
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "nb_types.hpp"

namespace nb {

// Type codes used in signature descriptors, e.g. "i32(i32,i32)".
template <typename T, typename = void>
struct SignatureCode;

template <> struct SignatureCode<void> { static std::string get() { return "void"; } };
template <> struct SignatureCode<bool> { static std::string get() { return "bool"; } };
template <> struct SignatureCode<float> { static std::string get() { return "f32"; } };
template <> struct SignatureCode<double> { static std::string get() { return "f64"; } };
template <> struct SignatureCode<const char*> { static std::string get() { return "str"; } };
template <> struct SignatureCode<char*> { static std::string get() { return "str"; } };
template <> struct SignatureCode<void*> { static std::string get() { return "ptr"; } };
template <> struct SignatureCode<const void*> { static std::string get() { return "ptr"; } };

template <typename T>
struct SignatureCode<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::string get() {
        return std::string(std::is_signed_v<T> ? "i" : "u") + std::to_string(sizeof(T) * 8);
    }
};

template <typename Sig>
struct SignatureOf;

template <typename R, typename... Args>
struct SignatureOf<R(Args...)> {
    static std::string get() {
        std::string out = SignatureCode<R>::get() + "(";
        bool first = true;
        ((out += (first ? "" : ","), out += SignatureCode<Args>::get(), first = false), ...);
        return out + ")";
    }
};

// Prefix of the optional descriptor a library exports next to a function:
// `extern "C" const char nb_sig_<function>[] = "i32(i32,i32)";`
inline constexpr const char* kSignatureSymbolPrefix = "nb_sig_";

struct NATIVEBRIDGE_API LoadedLibrary {
    std::string name;     // normalized name, cache key
    fs::path path;        // resolved file, empty when found via the OS search path
    void* handle = nullptr;
};

template <typename Sig>
class NativeFunction;

// A bound export. Keeps its library's cache entry alive.
template <typename R, typename... Args>
class NativeFunction<R(Args...)> {
public:
    using Pointer = R (*)(Args...);

    NativeFunction(std::shared_ptr<const LoadedLibrary> lib, Pointer fn, std::string symbol)
        : lib_(std::move(lib)), fn_(fn), symbol_(std::move(symbol)) {}

    R operator()(Args... args) const { return fn_(args...); }

    const std::string& symbol() const { return symbol_; }
    const LoadedLibrary& library() const { return *lib_; }

private:
    std::shared_ptr<const LoadedLibrary> lib_;
    Pointer fn_;
    std::string symbol_;
};

class NATIVEBRIDGE_API SymbolCache {
public:
    // Process-wide cache shared by the host and every module.
    static SymbolCache& instance();

    // Library handles stay open for the process lifetime.
    SymbolCache() = default;
    SymbolCache(const SymbolCache&) = delete;
    SymbolCache& operator=(const SymbolCache&) = delete;

    // Appends the platform extension when `library_name` has none.
    static std::string normalize_library_name(const std::string& library_name);

    void add_search_dir(const fs::path& dir);
    std::vector<fs::path> search_dirs() const;

    // Missing signature descriptors are rejected when strict.
    void set_strict_signatures(bool strict);
    bool strict_signatures() const;

    // Loads on first request, then returns the memoized entry.
    // Throws BridgeError(LibraryNotFound).
    std::shared_ptr<const LoadedLibrary> acquire(const std::string& library_name);

    // Raw export lookup, never cached. Throws BridgeError(SymbolNotFound).
    void* resolve_address(const LoadedLibrary& lib, const std::string& function_name) const;

    // Throws BridgeError(SignatureMismatch) when the library describes
    // `function_name` differently (or not at all, in strict mode).
    void check_signature(const LoadedLibrary& lib, const std::string& function_name,
                         const std::string& expected) const;

    template <typename Sig>
    NativeFunction<Sig> resolve(const std::string& library_name, const std::string& function_name) {
        auto lib = acquire(library_name);
        void* addr = resolve_address(*lib, function_name);
        check_signature(*lib, function_name, SignatureOf<Sig>::get());
        using Pointer = typename NativeFunction<Sig>::Pointer;
        Pointer fn = reinterpret_cast<Pointer>(reinterpret_cast<std::uintptr_t>(addr));
        return NativeFunction<Sig>(std::move(lib), fn, function_name);
    }

    bool is_loaded(const std::string& library_name) const;
    // Number of OS-level loads performed by this cache.
    int load_count() const;
    std::vector<std::string> loaded_libraries() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const LoadedLibrary>> libraries_;
    std::vector<fs::path> search_dirs_;
    bool strict_signatures_ = false;
    int load_count_ = 0;
};

} // namespace nb
