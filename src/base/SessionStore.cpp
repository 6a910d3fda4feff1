#include "SessionStore.hpp"

#include "DeviceProfile.hpp"

namespace mx {
optional<string> SessionStore::getString(const string& key) const {
  json value = get(key);
  if (!value.is_string()) {
    return nullopt;
  }
  string s = value.get<string>();
  if (s.empty()) {
    return nullopt;
  }
  return s;
}

JsonFileSessionStore::JsonFileSessionStore(const string& _path)
    : path(_path), data(defaults()) {}

json JsonFileSessionStore::defaults() {
  DeviceProfile profile;
  profile.deviceId = sole::uuid4().str();
  MemorySessionStore scratch;
  profile.writeTo(&scratch);
  return scratch.getAll();
}

void JsonFileSessionStore::load() {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  if (!fs::exists(path)) {
    VLOG(1) << "No session file at " << path;
    return;
  }
  ifstream in(path);
  if (!in.good()) {
    LOG(WARNING) << "Could not open session file " << path;
    return;
  }
  json loaded = json::parse(in, nullptr, false);
  if (loaded.is_discarded() || !loaded.is_object()) {
    LOG(WARNING) << "Ignoring corrupt session file " << path;
    return;
  }
  for (auto it = loaded.begin(); it != loaded.end(); ++it) {
    data[it.key()] = it.value();
  }
  VLOG(1) << "Loaded session from " << path;
}

void JsonFileSessionStore::save() {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  string text;
  try {
    text = data.dump(2, ' ', false, json::error_handler_t::replace);
  } catch (const json::exception& je) {
    throw PersistenceError("Could not serialize session: " +
                           string(je.what()));
  }
  fs::path filePath(path);
  std::error_code ec;
  if (filePath.has_parent_path()) {
    fs::create_directories(filePath.parent_path(), ec);
    if (ec) {
      throw PersistenceError("Could not create " +
                             filePath.parent_path().string() + ": " +
                             ec.message());
    }
  }
  ofstream out(path, ios::out | ios::trunc);
  if (!out.good()) {
    throw PersistenceError("Could not open " + path + " for writing: " +
                           strerror(errno));
  }
  out << text << endl;
  out.close();
  if (out.fail()) {
    throw PersistenceError("Could not write " + path);
  }
}

json JsonFileSessionStore::get(const string& key,
                               const json& defaultValue) const {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  auto it = data.find(key);
  if (it == data.end()) {
    return defaultValue;
  }
  return *it;
}

void JsonFileSessionStore::set(const string& key, const json& value) {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  data[key] = value;
}

json JsonFileSessionStore::getAll() const {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  return data;
}

MemorySessionStore::MemorySessionStore()
    : data(json::object()), saveCount(0), failSaves(false) {}

void MemorySessionStore::save() {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  if (failSaves) {
    throw PersistenceError("Saving is disabled");
  }
  saveCount++;
}

json MemorySessionStore::get(const string& key,
                             const json& defaultValue) const {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  auto it = data.find(key);
  if (it == data.end()) {
    return defaultValue;
  }
  return *it;
}

void MemorySessionStore::set(const string& key, const json& value) {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  data[key] = value;
}

json MemorySessionStore::getAll() const {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  return data;
}

int MemorySessionStore::getSaveCount() const {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  return saveCount;
}

void MemorySessionStore::setFailSaves(bool fail) {
  lock_guard<std::recursive_mutex> guard(storeMutex);
  failSaves = fail;
}
}  // namespace mx
