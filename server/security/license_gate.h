#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace blockpipe {

struct LicenseConfig {
  bool enabled{false};
  // Empty accepts any non-empty key.
  std::string key;
  // Unix seconds; 0 never expires.
  int64_t expires_at{0};
  double check_interval_s{300.0};
  double session_ttl_s{3600.0};
};

class LicenseValidator {
public:
  virtual ~LicenseValidator() = default;
  virtual bool Validate(const std::string &license_key) const = 0;
  // Periodic re-check of the node's own license.
  virtual bool Recheck() = 0;
};

// Compares SHA-256 digests of presented keys against the configured key.
class KeyLicenseValidator : public LicenseValidator {
public:
  KeyLicenseValidator(const std::string &configured_key, int64_t expires_at);

  bool Validate(const std::string &license_key) const override;
  bool Recheck() override;

  static std::string HashKey(const std::string &key);

private:
  std::string key_hash_;
  int64_t expires_at_;
};

struct SecurityEvent {
  int64_t timestamp_ms{0};
  std::string event;
  std::string session_id;
  std::string detail;

  nlohmann::json ToJson() const;
};

// ── LicenseGate ─────────────────────────────────────────────────────────────
// Session authorization in front of model execution. A disabled gate allows
// everything. When the runtime re-check fails the clear hook runs, every
// session is revoked, and LicenseError is thrown to the caller. The gate then
// stays closed until the license validates again.
class LicenseGate {
public:
  static constexpr std::size_t kMaxEvents = 1000;

  using ClearHook = std::function<void()>;
  using RevokeHook = std::function<void(const std::string &session_id)>;

  LicenseGate(LicenseConfig config,
              std::unique_ptr<LicenseValidator> validator = nullptr);

  // Runs on runtime re-check failure; drops decrypted in-memory state.
  void SetClearHook(ClearHook hook);
  // Runs for each revoked session; drops its KV history.
  void SetRevokeHook(RevokeHook hook);

  bool AuthorizeSession(const std::string &session_id,
                        const std::string &license_key);
  bool RevokeSession(const std::string &session_id,
                     const std::string &reason = "revoked");
  bool IsAuthorized(const std::string &session_id) const;
  // Throws LicenseError when the session is not authorized. Refreshes the
  // session's last-use time otherwise.
  void RequireAuthorized(const std::string &session_id);

  // Re-validates once every check_interval_s; `force` ignores the interval.
  void CheckRuntime(bool force = false);

  // Revokes sessions idle longer than session_ttl_s; returns their count.
  std::size_t PruneIdle();

  bool enabled() const { return config_.enabled; }
  std::size_t AuthorizedCount() const;
  std::vector<SecurityEvent> Events() const;
  nlohmann::json StatsJson() const;

private:
  void RecordEventLocked(const std::string &event,
                         const std::string &session_id,
                         const std::string &detail);
  bool RevokeLocked(const std::string &session_id, const std::string &reason,
                    std::vector<std::string> *revoked);
  // Runs the validator's re-check and updates the failure latch.
  bool RecheckLocked();

  LicenseConfig config_;
  std::unique_ptr<LicenseValidator> validator_;
  ClearHook clear_hook_;
  RevokeHook revoke_hook_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point>
      sessions_;
  std::deque<SecurityEvent> events_;
  std::chrono::steady_clock::time_point last_check_;
  // Set by a failed re-check; blocks authorization and execution until a
  // later re-check passes.
  bool runtime_failed_{false};
  uint64_t denied_{0};
};

} // namespace blockpipe
