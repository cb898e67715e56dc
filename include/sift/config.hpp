/**
 * @file config.hpp
 * @brief Section/key/value settings store with opt-in file backends.
 *
 * A ConfigStore is a fixed table of (section, key, value) strings. Backends
 * fill it from a text buffer; Config<Backends...> picks the backend by
 * explicit format or by file extension. Each backend is compiled only when
 * its CMake option is on:
 *
 *   SIFT_CONFIG_INI   inih           *.ini *.cfg *.conf
 *   SIFT_CONFIG_JSON  nlohmann/json  *.json
 *   SIFT_CONFIG_YAML  fkYAML         *.yaml *.yml
 *
 * JSON and YAML documents are flattened one level: top-level objects become
 * sections, scalars at the top level land in the "" section.
 *
 * LoadIngestOptions() reads the [ingest] section:
 *
 *   [ingest]
 *   workers = 8
 *   large_file_threshold_mb = 10
 *   temp_dir = /var/tmp
 *   model_path = /opt/sift/model.dat
 *   max_metadata_bytes = 67108864
 *   shutdown_timeout_ms = 3600000
 */

#ifndef SIFT_CONFIG_HPP_
#define SIFT_CONFIG_HPP_

#include "sift/ingest_options.hpp"
#include "sift/log.hpp"
#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <exception>
#include <initializer_list>
#include <limits>
#include <string>

#ifdef SIFT_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef SIFT_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef SIFT_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef SIFT_CONFIG_MAX_FILE_SIZE
#define SIFT_CONFIG_MAX_FILE_SIZE (64U * 1024U)
#endif

namespace sift {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
  }
  return *a == *b;
}

/// True when only blanks follow @p end.
inline bool OnlyBlanks(const char* end) noexcept {
  while (*end == ' ' || *end == '\t') ++end;
  return *end == '\0';
}

/// Whole-string base-10 signed parse; fails on empty, junk or overflow.
inline optional<int64_t> ParseSigned(const char* text) noexcept {
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(text, &end, 10);
  if (end == text || errno == ERANGE || !OnlyBlanks(end)) return {};
  return optional<int64_t>{static_cast<int64_t>(v)};
}

/// Same for unsigned values; a leading '-' is rejected instead of wrapped.
inline optional<uint64_t> ParseUnsigned(const char* text) noexcept {
  const char* p = text;
  while (*p == ' ' || *p == '\t') ++p;
  if (*p == '-') return {};
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(p, &end, 10);
  if (end == p || errno == ERANGE || !OnlyBlanks(end)) return {};
  return optional<uint64_t>{static_cast<uint64_t>(v)};
}

inline const char* FileExtension(const char* path) noexcept {
  const char* ext = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '.') {
      ext = p + 1;
    } else if (*p == '/') {
      ext = nullptr;
    }
  }
  return ext;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    for (const char* e : {"ini", "cfg", "conf"}) {
      if (detail::CaseEqual(ext, e)) return true;
    }
    return false;
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kNameCapacity = 63;
  static constexpr uint32_t kValueCapacity = 255;

  const char* GetString(const char* section, const char* key, const char* default_val = "") const {
    const Entry* e = Lookup(section, key);
    return e != nullptr ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  uint64_t GetUint64(const char* section, const char* key, uint64_t default_val = 0) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return default_val;
    optional<uint64_t> v = detail::ParseUnsigned(e->value.c_str());
    return v.has_value() ? v.value() : default_val;
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return default_val;
    for (const char* yes : {"true", "yes", "on", "1"}) {
      if (detail::CaseEqual(e->value.c_str(), yes)) return true;
    }
    return false;
  }

  /// Integer value, or nothing when the key is absent or not a 32-bit integer.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return {};
    optional<int64_t> v = detail::ParseSigned(e->value.c_str());
    if (!v.has_value() || v.value() < std::numeric_limits<int32_t>::min() ||
        v.value() > std::numeric_limits<int32_t>::max()) {
      return {};
    }
    return optional<int32_t>{static_cast<int32_t>(v.value())};
  }

  /**
   * @brief Insert or overwrite one value, e.g. a command-line override.
   * @return false when the table is full. Overlong text is truncated.
   */
  bool Set(const char* section, const char* key, const char* value) {
    SIFT_ASSERT(section != nullptr && key != nullptr);
    Entry* e = Lookup(section, key);
    if (e == nullptr) {
      if (count_ == kMaxEntries) {
        SIFT_LOG_WARN("Config", "table full, dropping [%s] %s", section, key);
        return false;
      }
      e = &entries_[count_++];
      e->section.assign(TruncateToCapacity, section);
      e->key.assign(TruncateToCapacity, key);
    }
    e->value.assign(TruncateToCapacity, value != nullptr ? value : "");
    return true;
  }

  bool HasSection(const char* section) const {
    SIFT_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const { return Lookup(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return count_; }

 private:
  struct Entry {
    FixedString<kNameCapacity> section;
    FixedString<kNameCapacity> key;
    FixedString<kValueCapacity> value;
  };

  const Entry* Lookup(const char* section, const char* key) const {
    SIFT_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      const Entry& e = entries_[i];
      if (detail::CaseEqual(e.key.c_str(), key) && detail::CaseEqual(e.section.c_str(), section)) return &e;
    }
    return nullptr;
  }

  Entry* Lookup(const char* section, const char* key) {
    return const_cast<Entry*>(static_cast<const ConfigStore*>(this)->Lookup(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_{0};
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Fallback for a backend whose library is not compiled in.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SIFT_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  /// @p data must be null-terminated; inih stops at the terminator.
  static expected<void, ConfigError> Parse(ConfigStore& store, const char* data, uint32_t) {
    int line = ini_parse_string(data, &OnValue, &store);
    if (line != 0) {
      SIFT_LOG_ERROR("Config", "INI error at line %d", line);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnValue(void* user, const char* section, const char* name, const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section != nullptr ? section : "", name != nullptr ? name : "", value)
               ? 1
               : 0;
  }
};
#endif

#ifdef SIFT_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const char* data, uint32_t size) {
    nlohmann::json doc = nlohmann::json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      SIFT_LOG_ERROR("Config", "JSON document is malformed or not an object");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (const auto& top : doc.items()) {
      bool ok = true;
      if (top.value().is_object()) {
        for (const auto& kv : top.value().items()) {
          ok = ok && store.Set(top.key().c_str(), kv.key().c_str(), Text(kv.value()).c_str());
        }
      } else {
        ok = store.Set("", top.key().c_str(), Text(top.value()).c_str());
      }
      if (!ok) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return std::string();
    return v.dump();  // numbers, booleans and nested containers
  }
};
#endif

#ifdef SIFT_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const char* data, uint32_t size) {
    fkyaml::node doc;
    try {
      doc = fkyaml::node::deserialize(std::string(data, size));
    } catch (const std::exception& e) {
      SIFT_LOG_ERROR("Config", "YAML parse failed: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!doc.is_mapping()) {
      SIFT_LOG_ERROR("Config", "YAML document is not a mapping");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto top = doc.begin(); top != doc.end(); ++top) {
      const std::string name = top.key().get_value<std::string>();
      bool ok = true;
      if (top->is_mapping()) {
        for (auto kv = top->begin(); kv != top->end(); ++kv) {
          ok = ok && store.Set(name.c_str(), kv.key().get_value<std::string>().c_str(), Text(*kv).c_str());
        }
      } else {
        ok = store.Set("", name.c_str(), Text(*top).c_str());
      }
      if (!ok) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Text(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) return std::to_string(v.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config needs at least one backend");

 public:
  /**
   * @brief Read @p path and parse it with the backend for @p format.
   *
   * kAuto picks the backend from the file extension, falling back to the
   * first backend listed. Files larger than SIFT_CONFIG_MAX_FILE_SIZE are
   * rejected with kBufferFull.
   */
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    SIFT_ASSERT(path != nullptr);
    std::string text;
    auto read = ReadWhole(path, text);
    if (!read.has_value()) return read;
    if (format == ConfigFormat::kAuto) format = FormatForPath(path);
    return LoadBuffer(text.c_str(), static_cast<uint32_t>(text.size()), format);
  }

  /// @p data must be null-terminated at @p size for the INI backend.
  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    SIFT_ASSERT(data != nullptr);
    auto result = expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    (void)((Backends::kFormat == format && (result = ConfigParser<Backends>::Parse(*this, data, size), true)) || ...);
    return result;
  }

  static ConfigFormat FormatForPath(const char* path) noexcept {
    ConfigFormat found = FirstFormat();
    const char* ext = detail::FileExtension(path);
    if (ext != nullptr) {
      (void)((Backends::MatchesExtension(ext) && (found = Backends::kFormat, true)) || ...);
    }
    return found;
  }

 private:
  static constexpr ConfigFormat FirstFormat() noexcept {
    constexpr ConfigFormat kFormats[] = {Backends::kFormat...};
    return kFormats[0];
  }

  static expected<void, ConfigError> ReadWhole(const char* path, std::string& out) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      SIFT_LOG_ERROR("Config", "cannot open %s", path);
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0U && out.size() <= SIFT_CONFIG_MAX_FILE_SIZE) {
      out.append(chunk, n);
    }
    const bool failed = std::ferror(f) != 0;
    (void)std::fclose(f);
    if (failed) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (out.size() > SIFT_CONFIG_MAX_FILE_SIZE) {
      SIFT_LOG_ERROR("Config", "%s exceeds %u bytes", path, static_cast<unsigned>(SIFT_CONFIG_MAX_FILE_SIZE));
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }
};

#ifdef SIFT_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef SIFT_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef SIFT_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

namespace detail {

#ifdef SIFT_CONFIG_INI_ENABLED
constexpr bool kIniCompiled = true;
#else
constexpr bool kIniCompiled = false;
#endif
#ifdef SIFT_CONFIG_JSON_ENABLED
constexpr bool kJsonCompiled = true;
#else
constexpr bool kJsonCompiled = false;
#endif
#ifdef SIFT_CONFIG_YAML_ENABLED
constexpr bool kYamlCompiled = true;
#else
constexpr bool kYamlCompiled = false;
#endif

template <typename... Ts>
struct BackendList {};

template <typename List, bool kKeep, typename B>
struct AppendIf {
  using type = List;
};

template <typename... Ts, typename B>
struct AppendIf<BackendList<Ts...>, true, B> {
  using type = BackendList<Ts..., B>;
};

template <typename List>
struct ConfigFor;

template <typename... Ts>
struct ConfigFor<BackendList<Ts...>> {
  using type = Config<Ts...>;
};

using CompiledBackends = typename AppendIf<
    typename AppendIf<typename AppendIf<BackendList<>, kIniCompiled, IniBackend>::type, kJsonCompiled,
                      JsonBackend>::type,
    kYamlCompiled, YamlBackend>::type;

}  // namespace detail

#if defined(SIFT_CONFIG_INI_ENABLED) || defined(SIFT_CONFIG_JSON_ENABLED) || defined(SIFT_CONFIG_YAML_ENABLED)
/// Every compiled-in backend, in INI, JSON, YAML order.
using MultiConfig = typename detail::ConfigFor<detail::CompiledBackends>::type;
#endif

// ============================================================================
// IngestOptions mapping
// ============================================================================

static constexpr const char* kIngestSection = "ingest";

namespace detail {

/// Positive int from [ingest] @p key into @p out; absent keys leave it alone.
inline bool ReadPositive(const ConfigStore& cfg, const char* key, uint32_t& out) {
  if (!cfg.HasKey(kIngestSection, key)) return true;
  optional<int32_t> v = cfg.FindInt(kIngestSection, key);
  if (!v.has_value() || v.value() <= 0) {
    SIFT_LOG_ERROR("Config", "[ingest] %s = '%s' is not a positive integer", key,
                   cfg.GetString(kIngestSection, key));
    return false;
  }
  out = static_cast<uint32_t>(v.value());
  return true;
}

}  // namespace detail

/**
 * @brief Overlay the [ingest] section of @p cfg onto @p base.
 *
 * Keys that are absent keep the value from @p base. A threshold given in
 * megabytes clears any byte-exact threshold carried by @p base. The merged
 * options go through ValidateIngestOptions().
 */
inline expected<IngestOptions, ConfigError> LoadIngestOptions(const ConfigStore& cfg,
                                                              const IngestOptions& base = IngestOptions{}) {
  IngestOptions opts = base;
  const char* s = kIngestSection;

  if (!detail::ReadPositive(cfg, "workers", opts.worker_count) ||
      !detail::ReadPositive(cfg, "large_file_threshold_mb", opts.large_file_threshold_mb)) {
    return expected<IngestOptions, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (cfg.HasKey(s, "large_file_threshold_mb")) opts.large_file_threshold_bytes = 0;

  if (cfg.HasKey(s, "temp_dir")) opts.temp_dir = cfg.GetString(s, "temp_dir");
  if (cfg.HasKey(s, "model_path")) opts.model_path = cfg.GetString(s, "model_path");
  opts.max_metadata_bytes = cfg.GetUint64(s, "max_metadata_bytes", opts.max_metadata_bytes);
  opts.shutdown_timeout_ms = cfg.GetUint64(s, "shutdown_timeout_ms", opts.shutdown_timeout_ms);

  auto valid = ValidateIngestOptions(opts);
  if (!valid.has_value()) return expected<IngestOptions, ConfigError>::error(valid.get_error());
  return expected<IngestOptions, ConfigError>::success(opts);
}

}  // namespace sift

#endif  // SIFT_CONFIG_HPP_
