#ifndef __MX_SESSION_STORE__
#define __MX_SESSION_STORE__

#include "Errors.hpp"
#include "Headers.hpp"

namespace mx {
/**
 * @brief Durable key-value storage for the device profile and credentials.
 */
class SessionStore {
 public:
  virtual ~SessionStore() {}

  /** @brief Reads persisted values over the in-memory ones. */
  virtual void load() = 0;

  /**
   * @brief Writes the in-memory values out.
   * @throws PersistenceError when the backing storage cannot be written.
   */
  virtual void save() = 0;

  /** @brief Returns the value, or `defaultValue` when it is absent. */
  virtual json get(const string& key,
                   const json& defaultValue = json()) const = 0;

  virtual void set(const string& key, const json& value) = 0;

  virtual json getAll() const = 0;

  /** @brief Convenience accessor for string keys that may be null. */
  optional<string> getString(const string& key) const;
};

/**
 * @brief SessionStore backed by a pretty-printed json file.
 *
 * A fresh store starts with the device profile defaults, a random device id
 * and null `token`/`phone`.
 */
class JsonFileSessionStore : public SessionStore {
 public:
  explicit JsonFileSessionStore(const string& _path);

  void load() override;
  void save() override;
  json get(const string& key, const json& defaultValue = json()) const override;
  void set(const string& key, const json& value) override;
  json getAll() const override;

  const string& getPath() const { return path; }

  static json defaults();

 protected:
  string path;
  json data;
  mutable std::recursive_mutex storeMutex;
};

/**
 * @brief SessionStore that keeps everything in memory.  Used when no file
 * is wanted and by tests.
 */
class MemorySessionStore : public SessionStore {
 public:
  MemorySessionStore();

  void load() override {}
  void save() override;
  json get(const string& key, const json& defaultValue = json()) const override;
  void set(const string& key, const json& value) override;
  json getAll() const override;

  /** @brief Number of successful save() calls. */
  int getSaveCount() const;

  /** @brief When set, save() throws PersistenceError. */
  void setFailSaves(bool fail);

 protected:
  json data;
  int saveCount;
  bool failSaves;
  mutable std::recursive_mutex storeMutex;
};
}  // namespace mx

#endif  // __MX_SESSION_STORE__
