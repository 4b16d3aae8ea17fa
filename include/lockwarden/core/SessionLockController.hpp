#ifndef INCLUDE_LOCKWARDEN_CORE_SESSIONLOCKCONTROLLER_HPP
#define INCLUDE_LOCKWARDEN_CORE_SESSIONLOCKCONTROLLER_HPP

#include "lockwarden/core/AuditLog.hpp"
#include "lockwarden/core/BackgroundExecutor.hpp"
#include "lockwarden/core/CredentialCollection.hpp"
#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/core/IdleTimer.hpp"
#include "lockwarden/core/ProtocolErrors.hpp"
#include "lockwarden/core/Session.hpp"
#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/security/SecureString.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

namespace lockwarden::core
{

enum class LockState : std::uint8_t
{
    SignedOut,
    Unlocked,
    Locked,
    AwaitingSecondFactor,
};

[[nodiscard]] std::string_view toString(LockState state) noexcept;

// Lifecycle signals from the hosting environment.
enum class HostEvent : std::uint8_t
{
    Activity,
    Foregrounded,
    Backgrounded,
};

struct SessionConfig final
{
    // Zero disables the inactivity lock.
    std::chrono::milliseconds idleTimeout{ std::chrono::minutes{ 5 } };
};

// std::monostate means the session is now Unlocked.
using AuthOutcome = std::variant<std::monostate, MfaRequired, NotFound, InvalidCredentials, DecryptionFailure,
                                 RateLimited, NetworkError, ProtocolError, VaultError, Superseded, NotPermitted>;

using CommitOutcome = std::variant<std::monostate, InvalidCredentials, RateLimited, NetworkError, ProtocolError,
                                   VaultError, Superseded, NotPermitted>;

using EnrollOutcome =
    std::variant<SecondFactorEnrollment, InvalidCredentials, RateLimited, NetworkError, ProtocolError, NotPermitted>;

using ToggleOutcome = std::variant<bool, RateLimited, NetworkError, ProtocolError, NotPermitted>;

// Owns the signed-in session and decides when plaintext may exist in memory.
//
// States: SignedOut -> (signIn) -> AwaitingSecondFactor | Unlocked
//         Unlocked  -> (lock, inactivity) -> Locked -> (unlock) -> AwaitingSecondFactor | Unlocked
//         any       -> (logout) -> SignedOut
//
// Thread-safe. The state lock is never held across key derivation or network round trips; each sign-in,
// unlock or second-factor submission takes an attempt number and its result is discarded (Superseded)
// if anything else changed the session in the meantime. The most recently started attempt is the one
// that may commit. Vault modifications are serialized against each other by a separate commit lock,
// which only other modifications wait on.
class SessionLockController final
{
public:
    using StateListener = std::function<void(LockState)>;

    SessionLockController(CredentialProtocol& protocol, VaultCipher& cipher, IAuditLog& audit,
                          SessionConfig config = {});

    SessionLockController(const SessionLockController&) = delete;
    SessionLockController& operator=(const SessionLockController&) = delete;
    SessionLockController(SessionLockController&&) = delete;
    SessionLockController& operator=(SessionLockController&&) = delete;
    ~SessionLockController();

    [[nodiscard]] AuthOutcome signIn(std::string_view username, lockwarden::security::SecureString secret);
    [[nodiscard]] AuthOutcome unlock(lockwarden::security::SecureString secret);
    [[nodiscard]] AuthOutcome submitSecondFactor(std::string_view code);

    [[nodiscard]] std::future<AuthOutcome> signInAsync(std::string username,
                                                       lockwarden::security::SecureString secret);
    [[nodiscard]] std::future<AuthOutcome> unlockAsync(lockwarden::security::SecureString secret);
    [[nodiscard]] std::future<AuthOutcome> submitSecondFactorAsync(std::string code);

    // Returns to where the attempt started: Locked after unlock, SignedOut after signIn.
    void cancelSecondFactor();
    void lock();
    void logout();
    void post(HostEvent event);

    [[nodiscard]] LockState state() const;
    [[nodiscard]] std::string username() const;

    // The visitor runs under the controller's lock and must not call back into it.
    // Returns false unless Unlocked.
    bool readCollection(const std::function<void(const CredentialCollection&)>& visitor) const;

    // Applies the mutation to a copy, seals it, stores it remotely, and only then replaces the in-memory
    // collection. Counts as user activity. Concurrent calls run one after another, each on top of the
    // previous result; a call made from inside a mutator returns NotPermitted.
    [[nodiscard]] CommitOutcome modifyCollection(const std::function<void(CredentialCollection&)>& mutator);

    [[nodiscard]] EnrollOutcome enrollSecondFactor();
    [[nodiscard]] ToggleOutcome confirmSecondFactor(std::string_view code);
    [[nodiscard]] ToggleOutcome disableSecondFactor();

    // Invoked after every transition, outside the controller's lock, possibly from the timer thread.
    void setStateListener(StateListener listener);

private:
    CredentialProtocol* m_protocol{ nullptr };
    VaultCipher* m_cipher{ nullptr };
    IAuditLog* m_audit{ nullptr };
    SessionConfig m_config;

    mutable std::mutex m_mutex;
    LockState m_state{ LockState::SignedOut };
    Session m_session;
    lockwarden::security::SecureString m_pendingSecret;
    std::optional<CredentialCollection> m_pendingCollection;
    LockState m_cancelTarget{ LockState::SignedOut };
    bool m_foreground{ true };
    std::uint64_t m_attempt{ 0 };
    IdleTimer::Generation m_timerGeneration{ 0 };

    // Held for a whole mutate, seal, store and commit sequence.
    std::mutex m_commitMutex;
    std::atomic<std::thread::id> m_committer{};

    std::mutex m_listenerMutex;
    StateListener m_listener;

    // Destroyed first: queued work drains, then the timer thread stops, while the state above is alive.
    IdleTimer m_timer;
    BackgroundExecutor m_executor;

    void onIdleExpired(IdleTimer::Generation generation) noexcept;

    [[nodiscard]] CommitOutcome applyModification(const std::function<void(CredentialCollection&)>& mutator);
    [[nodiscard]] AuthOutcome commitUnlocked(std::uint64_t attempt, Session session, std::string_view action);
    [[nodiscard]] AuthOutcome commitAwaiting(std::uint64_t attempt, std::string_view username, LockState origin,
                                             lockwarden::security::SecureString secret,
                                             std::optional<CredentialCollection> opened);
    void lockDown(std::string_view reason);
    void rearmTimer();
    void clearPending() noexcept;
    void notify(LockState state);
    void audit(std::string_view username, std::string_view action) const noexcept;
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_SESSIONLOCKCONTROLLER_HPP
