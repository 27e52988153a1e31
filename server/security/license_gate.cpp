#include "server/security/license_gate.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace blockpipe {

namespace {
int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}
} // namespace

KeyLicenseValidator::KeyLicenseValidator(const std::string &configured_key,
                                         int64_t expires_at)
    : key_hash_(configured_key.empty() ? std::string()
                                       : HashKey(configured_key)),
      expires_at_(expires_at) {}

std::string KeyLicenseValidator::HashKey(const std::string &key) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(key.data()), key.size(),
         hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

bool KeyLicenseValidator::Validate(const std::string &license_key) const {
  if (license_key.empty()) {
    return false;
  }
  if (expires_at_ > 0 && NowMs() / 1000 >= expires_at_) {
    return false;
  }
  return key_hash_.empty() || HashKey(license_key) == key_hash_;
}

bool KeyLicenseValidator::Recheck() {
  if (expires_at_ <= 0) {
    return true;
  }
  return NowMs() / 1000 < expires_at_;
}

json SecurityEvent::ToJson() const {
  return {{"timestamp", timestamp_ms},
          {"event", event},
          {"session_id", session_id},
          {"detail", detail}};
}

LicenseGate::LicenseGate(LicenseConfig config,
                         std::unique_ptr<LicenseValidator> validator)
    : config_(std::move(config)), validator_(std::move(validator)),
      last_check_(std::chrono::steady_clock::now()) {
  if (!validator_) {
    validator_ =
        std::make_unique<KeyLicenseValidator>(config_.key, config_.expires_at);
  }
}

void LicenseGate::SetClearHook(ClearHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  clear_hook_ = std::move(hook);
}

void LicenseGate::SetRevokeHook(RevokeHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  revoke_hook_ = std::move(hook);
}

void LicenseGate::RecordEventLocked(const std::string &event,
                                    const std::string &session_id,
                                    const std::string &detail) {
  events_.push_back({NowMs(), event, session_id, detail});
  while (events_.size() > kMaxEvents) {
    events_.pop_front();
  }
}

bool LicenseGate::AuthorizeSession(const std::string &session_id,
                                   const std::string &license_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (session_id.empty()) {
    return false;
  }
  if (config_.enabled && runtime_failed_ && !RecheckLocked()) {
    ++denied_;
    RecordEventLocked("authorization_denied", session_id,
                      "runtime license check failed");
    GlobalMetrics().RecordLicenseDenied();
    log::Warn("license", "authorization denied after failed runtime check",
              session_id);
    return false;
  }
  if (config_.enabled && !validator_->Validate(license_key)) {
    ++denied_;
    RecordEventLocked("authorization_denied", session_id, "invalid key");
    GlobalMetrics().RecordLicenseDenied();
    log::Warn("license", "authorization denied", session_id);
    return false;
  }
  sessions_[session_id] = std::chrono::steady_clock::now();
  RecordEventLocked("session_authorized", session_id, "");
  return true;
}

bool LicenseGate::RecheckLocked() {
  last_check_ = std::chrono::steady_clock::now();
  if (!validator_->Recheck()) {
    runtime_failed_ = true;
    return false;
  }
  if (runtime_failed_) {
    log::Info("license", "runtime license check recovered");
  }
  runtime_failed_ = false;
  RecordEventLocked("runtime_check_passed", "", "");
  return true;
}

bool LicenseGate::RevokeLocked(const std::string &session_id,
                               const std::string &reason,
                               std::vector<std::string> *revoked) {
  if (sessions_.erase(session_id) == 0) {
    return false;
  }
  RecordEventLocked("session_revoked", session_id, reason);
  revoked->push_back(session_id);
  return true;
}

bool LicenseGate::RevokeSession(const std::string &session_id,
                                const std::string &reason) {
  std::vector<std::string> revoked;
  RevokeHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    RevokeLocked(session_id, reason, &revoked);
    hook = revoke_hook_;
  }
  // KV state goes even if the session was never authorized.
  if (hook) {
    hook(session_id);
  }
  return !revoked.empty();
}

bool LicenseGate::IsAuthorized(const std::string &session_id) const {
  if (!config_.enabled) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(session_id) > 0;
}

void LicenseGate::RequireAuthorized(const std::string &session_id) {
  if (!config_.enabled) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    ++denied_;
    RecordEventLocked("unauthorized_access", session_id, "");
    GlobalMetrics().RecordLicenseDenied();
    throw LicenseError("Session " + session_id + " is not authorized");
  }
  it->second = std::chrono::steady_clock::now();
}

void LicenseGate::CheckRuntime(bool force) {
  if (!config_.enabled) {
    return;
  }
  std::vector<std::string> revoked;
  ClearHook clear;
  RevokeHook revoke;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (runtime_failed_) {
      // Stays closed until the license validates again.
      if (!RecheckLocked()) {
        throw LicenseError("Runtime license check failed");
      }
      return;
    }
    if (!force && std::chrono::duration<double>(now - last_check_).count() <
                      config_.check_interval_s) {
      return;
    }
    if (RecheckLocked()) {
      return;
    }
    RecordEventLocked("runtime_check_failed", "", "license no longer valid");
    std::vector<std::string> ids;
    for (const auto &entry : sessions_) {
      ids.push_back(entry.first);
    }
    for (const auto &id : ids) {
      RevokeLocked(id, "runtime_check_failed", &revoked);
    }
    clear = clear_hook_;
    revoke = revoke_hook_;
  }
  log::Error("license", "runtime license check failed",
             "revoked=" + std::to_string(revoked.size()));
  if (clear) {
    clear();
  }
  if (revoke) {
    for (const auto &id : revoked) {
      revoke(id);
    }
  }
  throw LicenseError("Runtime license check failed");
}

std::size_t LicenseGate::PruneIdle() {
  std::vector<std::string> revoked;
  RevokeHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> idle;
    for (const auto &[id, last_use] : sessions_) {
      if (std::chrono::duration<double>(now - last_use).count() >
          config_.session_ttl_s) {
        idle.push_back(id);
      }
    }
    for (const auto &id : idle) {
      RevokeLocked(id, "idle_timeout", &revoked);
    }
    hook = revoke_hook_;
  }
  if (hook) {
    for (const auto &id : revoked) {
      hook(id);
    }
  }
  return revoked.size();
}

std::size_t LicenseGate::AuthorizedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<SecurityEvent> LicenseGate::Events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {events_.begin(), events_.end()};
}

json LicenseGate::StatsJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  json recent = json::array();
  const std::size_t start = events_.size() > 20 ? events_.size() - 20 : 0;
  for (std::size_t i = start; i < events_.size(); ++i) {
    recent.push_back(events_[i].ToJson());
  }
  return {{"enabled", config_.enabled},
          {"runtime_check_failed", runtime_failed_},
          {"authorized_sessions", sessions_.size()},
          {"denied", denied_},
          {"recent_events", recent}};
}

} // namespace blockpipe
