#include <interop_api.h>
#include <bundle/bundle.hpp>
#include <bundle/bundle_reader.hpp>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

// Thread-local error storage
thread_local std::string g_last_error;

const char* engram_get_last_error() {
    return g_last_error.c_str();
}

const char* engram_get_version() {
    return "1.0.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

#define INTEROP_TRY_CATCH(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

static Engram::BundleReader* as_reader(h_bundle_reader_t handle) {
    if (!handle) throw std::runtime_error("Invalid reader handle");
    return static_cast<Engram::BundleReader*>(handle);
}

// =============================================================================
//  Bundle Reader
// =============================================================================

h_bundle_reader_t engram_reader_open(const char* bundle_text, size_t len) {
    INTEROP_TRY_CATCH_PTR({
        if (!bundle_text) throw std::runtime_error("Invalid parameters");
        auto bundle = Engram::parse_bundle(std::string(bundle_text, len));
        return static_cast<h_bundle_reader_t>(new Engram::BundleReader(std::move(bundle)));
    })
}

h_bundle_reader_t engram_reader_open_file(const char* path) {
    INTEROP_TRY_CATCH_PTR({
        if (!path) throw std::runtime_error("Invalid parameters");
        auto bundle = Engram::load_bundle(path);
        return static_cast<h_bundle_reader_t>(new Engram::BundleReader(std::move(bundle)));
    })
}

void engram_reader_destroy(h_bundle_reader_t handle) {
    if (handle) {
        delete static_cast<Engram::BundleReader*>(handle);
    }
}

size_t engram_reader_file_count(h_bundle_reader_t handle) {
    if (!handle) return 0;
    return static_cast<Engram::BundleReader*>(handle)->bundle().files.size();
}

const char* engram_reader_file_name(h_bundle_reader_t handle, size_t index) {
    INTEROP_TRY_CATCH_PTR({
        const auto& files = as_reader(handle)->bundle().files;
        if (index >= files.size()) throw std::out_of_range("File index out of range: " + std::to_string(index));
        return files[index].name.c_str();
    })
}

bool engram_reader_reconstruct(h_bundle_reader_t handle, const char* name,
                               uint8_t** out_data, size_t* out_len) {
    INTEROP_TRY_CATCH({
        if (!name || !out_data || !out_len) throw std::runtime_error("Invalid parameters");
        auto bytes = as_reader(handle)->reconstruct(name);

        // non-null even for a zero-length result
        auto* buffer = static_cast<uint8_t*>(std::malloc(bytes.empty() ? 1 : bytes.size()));
        if (!buffer) throw std::bad_alloc();
        if (!bytes.empty()) std::memcpy(buffer, bytes.data(), bytes.size());

        *out_data = buffer;
        *out_len = bytes.size();
        return true;
    })
}

void engram_free_buffer(uint8_t* data) {
    std::free(data);
}
