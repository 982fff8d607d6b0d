#pragma once

#include "handles.hpp"
#include "host_api.hpp"

#include <optional>
#include <string>

namespace modkit {

// Read-only handle on a key, closed when destroyed.
class Key {
 public:
  Key(HostApi* api, HostContext* ctx, const ModuleString& name, int mode = kKeyRead);
  Key(Key&& other) noexcept;
  Key& operator=(Key&& other) noexcept;
  Key(const Key&) = delete;
  Key& operator=(const Key&) = delete;
  ~Key();

  bool is_open() const { return raw_ != nullptr; }
  const ModuleString& name() const { return name_; }
  KeyType key_type() const;
  bool is_empty() const { return key_type() == KeyType::Empty; }

  // String payload, nullopt when the key is missing or holds another type.
  std::optional<std::string> read() const;
  long long expire() const;

 protected:
  HostApi* api_ = nullptr;
  HostContext* ctx_ = nullptr;
  HostKey* raw_ = nullptr;
  ModuleString name_;

 private:
  void close();
};

class WritableKey : public Key {
 public:
  WritableKey(HostApi* api, HostContext* ctx, const ModuleString& name);

  Status write(const std::string& value);
  Status remove();
  Status set_expire(long long ms);
};

} // namespace modkit
