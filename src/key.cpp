#include "key.hpp"

#include <utility>

namespace modkit {

Key::Key(HostApi* api, HostContext* ctx, const ModuleString& name, int mode) : api_(api), ctx_(ctx), name_(name) {
  if (api_ && !name_.is_null()) raw_ = api_->open_key(ctx_, name_.raw(), mode);
}

Key::Key(Key&& other) noexcept
    : api_(other.api_), ctx_(other.ctx_), raw_(std::exchange(other.raw_, nullptr)), name_(std::move(other.name_)) {}

Key& Key::operator=(Key&& other) noexcept {
  if (this == &other) return *this;
  close();
  api_ = other.api_;
  ctx_ = other.ctx_;
  raw_ = std::exchange(other.raw_, nullptr);
  name_ = std::move(other.name_);
  return *this;
}

Key::~Key() { close(); }

void Key::close() {
  if (raw_) {
    api_->close_key(raw_);
    raw_ = nullptr;
  }
}

KeyType Key::key_type() const {
  if (!raw_) return KeyType::Empty;
  return api_->key_type(raw_);
}

std::optional<std::string> Key::read() const {
  if (key_type() != KeyType::String) return std::nullopt;
  std::size_t len = 0;
  const char* p = api_->string_get(raw_, &len);
  if (!p) return std::nullopt;
  return std::string(p, len);
}

long long Key::expire() const {
  if (!raw_) return kNoExpire;
  return api_->get_expire(raw_);
}

WritableKey::WritableKey(HostApi* api, HostContext* ctx, const ModuleString& name)
    : Key(api, ctx, name, kKeyRead | kKeyWrite) {}

Status WritableKey::write(const std::string& value) {
  if (!raw_) return Status::Err;
  ModuleString payload(api_, ctx_, value);
  return to_status(api_->string_set(raw_, payload.raw()));
}

Status WritableKey::remove() {
  if (!raw_) return Status::Err;
  return to_status(api_->delete_key(raw_));
}

Status WritableKey::set_expire(long long ms) {
  if (!raw_) return Status::Err;
  return to_status(api_->set_expire(raw_, ms));
}

}  // namespace modkit
