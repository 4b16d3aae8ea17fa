#include "lockwarden/core/SessionLockController.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/security/ScopeWipe.hpp"

#include <atomic>
#include <exception>
#include <thread>
#include <type_traits>
#include <utility>

namespace lockwarden::core
{
namespace
{

template <class T, class Variant> struct IsAlternative;

template <class T, class... Ts>
struct IsAlternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)>
{
};

// Re-expresses a protocol result as a controller outcome. Alternatives the outcome cannot carry are
// protocol violations from the controller's point of view.
template <class Outcome, class Result> [[nodiscard]] Outcome convertOutcome(Result&& result)
{
    return std::visit(
        [](auto&& alternative) -> Outcome
        {
            using Alternative = std::decay_t<decltype(alternative)>;
            if constexpr (IsAlternative<Alternative, Outcome>::value)
            {
                return Outcome{ std::in_place_type<Alternative>, std::forward<decltype(alternative)>(alternative) };
            }
            else
            {
                return Outcome{ ProtocolError{ "unexpected result from the authority" } };
            }
        },
        std::forward<Result>(result));
}

[[nodiscard]] AuthOutcome fromVaultError(VaultError error)
{
    if (error == VaultError::DecryptionFailure || error == VaultError::InvalidVaultFormat)
    {
        return DecryptionFailure{};
    }
    return error;
}

struct OpenedVault final
{
    CredentialCollection collection;
    std::optional<SealedVault> sealed;
};

using OpenResult = std::variant<OpenedVault, AuthOutcome>;

// An account that never stored a vault opens as an empty collection.
[[nodiscard]] OpenResult fetchAndOpen(CredentialProtocol& protocol, VaultCipher& cipher, const SessionToken& token,
                                      const lockwarden::security::SecureString& secret)
{
    auto fetched{ protocol.fetchVault(token) };
    auto* maybeSealed{ std::get_if<std::optional<SealedVault>>(&fetched) };
    if (maybeSealed == nullptr)
    {
        return convertOutcome<AuthOutcome>(std::move(fetched));
    }

    if (!maybeSealed->has_value())
    {
        return OpenedVault{};
    }

    auto opened{ cipher.unseal(**maybeSealed, secret) };
    if (const auto* error{ std::get_if<VaultError>(&opened) })
    {
        return fromVaultError(*error);
    }
    return OpenedVault{ std::get<CredentialCollection>(std::move(opened)), std::move(*maybeSealed) };
}

// Records which thread is inside modifyCollection for as long as it holds the commit lock.
class CommitterMark final
{
public:
    explicit CommitterMark(std::atomic<std::thread::id>& committer) : m_committer(committer)
    {
        m_committer.store(std::this_thread::get_id());
    }

    CommitterMark(const CommitterMark&) = delete;
    CommitterMark& operator=(const CommitterMark&) = delete;
    CommitterMark(CommitterMark&&) = delete;
    CommitterMark& operator=(CommitterMark&&) = delete;

    ~CommitterMark()
    {
        m_committer.store(std::thread::id{});
    }

private:
    std::atomic<std::thread::id>& m_committer;
};

} // namespace

std::string_view toString(LockState state) noexcept
{
    switch (state)
    {
    case LockState::SignedOut:
        return "signed out";
    case LockState::Unlocked:
        return "unlocked";
    case LockState::Locked:
        return "locked";
    case LockState::AwaitingSecondFactor:
        return "awaiting second factor";
    }
    return "unknown";
}

SessionLockController::SessionLockController(CredentialProtocol& protocol, VaultCipher& cipher, IAuditLog& audit,
                                             SessionConfig config)
    : m_protocol(&protocol), m_cipher(&cipher), m_audit(&audit), m_config(config),
      m_timer([this](IdleTimer::Generation generation) { onIdleExpired(generation); })
{
}

SessionLockController::~SessionLockController()
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    ++m_attempt;
    m_timer.cancel();
    clearPending();
    m_session.lockDown();
}

AuthOutcome SessionLockController::signIn(std::string_view username, lockwarden::security::SecureString secret)
{
    std::uint64_t attempt{};
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::SignedOut)
        {
            return NotPermitted{};
        }
        attempt = ++m_attempt;
    }

    auto login{ m_protocol->login(username, secret) };
    if (std::holds_alternative<MfaRequired>(login))
    {
        return commitAwaiting(attempt, username, LockState::SignedOut, std::move(secret), std::nullopt);
    }

    auto* token{ std::get_if<SessionToken>(&login) };
    if (token == nullptr)
    {
        if (std::holds_alternative<InvalidCredentials>(login))
        {
            audit(username, "Login failed");
        }
        return convertOutcome<AuthOutcome>(std::move(login));
    }
    auto wipeToken{ lockwarden::security::scopeWipe(token->value) };

    auto status{ m_protocol->mfaStatus(username) };
    const auto* enrolled{ std::get_if<bool>(&status) };
    if (enrolled == nullptr)
    {
        return convertOutcome<AuthOutcome>(std::move(status));
    }
    if (*enrolled)
    {
        return commitAwaiting(attempt, username, LockState::SignedOut, std::move(secret), std::nullopt);
    }

    auto opened{ fetchAndOpen(*m_protocol, *m_cipher, *token, secret) };
    if (auto* failure{ std::get_if<AuthOutcome>(&opened) })
    {
        return std::move(*failure);
    }
    auto& vault{ std::get<OpenedVault>(opened) };

    Session session{ std::string{ username } };
    session.setToken(*token);
    session.setSecret(std::move(secret));
    session.setCollection(std::move(vault.collection));
    session.setSealed(std::move(vault.sealed));
    return commitUnlocked(attempt, std::move(session), "User logged in");
}

AuthOutcome SessionLockController::unlock(lockwarden::security::SecureString secret)
{
    std::uint64_t attempt{};
    std::string username;
    std::optional<SealedVault> sealed;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::Locked)
        {
            return NotPermitted{};
        }
        attempt = ++m_attempt;
        username = m_session.username();
        sealed = m_session.sealed();
    }

    // The secret is verified before anything else: locally against the cached vault when there is one,
    // otherwise by the authority.
    if (secret.empty())
    {
        audit(username, "Unlock failed");
        return InvalidCredentials{};
    }

    std::optional<CredentialCollection> collection;
    std::optional<SessionToken> token;
    bool secondFactorDemanded{ false };
    if (sealed.has_value())
    {
        auto opened{ m_cipher->unseal(*sealed, secret) };
        if (const auto* error{ std::get_if<VaultError>(&opened) })
        {
            if (*error == VaultError::DecryptionFailure || *error == VaultError::InvalidInput)
            {
                audit(username, "Unlock failed");
                return InvalidCredentials{};
            }
            return fromVaultError(*error);
        }
        collection = std::get<CredentialCollection>(std::move(opened));
    }
    else
    {
        auto login{ m_protocol->login(username, secret) };
        if (std::holds_alternative<MfaRequired>(login))
        {
            secondFactorDemanded = true;
        }
        else if (auto* issued{ std::get_if<SessionToken>(&login) })
        {
            token = std::move(*issued);
        }
        else
        {
            if (std::holds_alternative<InvalidCredentials>(login))
            {
                audit(username, "Unlock failed");
            }
            return convertOutcome<AuthOutcome>(std::move(login));
        }
    }

    if (!secondFactorDemanded)
    {
        auto status{ m_protocol->mfaStatus(username) };
        const auto* enrolled{ std::get_if<bool>(&status) };
        if (enrolled == nullptr)
        {
            return convertOutcome<AuthOutcome>(std::move(status));
        }
        secondFactorDemanded = *enrolled;
    }
    if (secondFactorDemanded)
    {
        return commitAwaiting(attempt, username, LockState::Locked, std::move(secret), std::move(collection));
    }

    if (!token.has_value())
    {
        auto login{ m_protocol->login(username, secret) };
        auto* issued{ std::get_if<SessionToken>(&login) };
        if (issued == nullptr)
        {
            return convertOutcome<AuthOutcome>(std::move(login));
        }
        token = std::move(*issued);
    }
    auto wipeToken{ lockwarden::security::scopeWipe(token->value) };

    if (!collection.has_value())
    {
        auto opened{ fetchAndOpen(*m_protocol, *m_cipher, *token, secret) };
        if (auto* failure{ std::get_if<AuthOutcome>(&opened) })
        {
            return std::move(*failure);
        }
        auto& vault{ std::get<OpenedVault>(opened) };
        collection = std::move(vault.collection);
        sealed = std::move(vault.sealed);
    }

    Session session{ std::move(username) };
    session.setToken(*token);
    session.setSecret(std::move(secret));
    session.setCollection(std::move(*collection));
    session.setSealed(std::move(sealed));
    return commitUnlocked(attempt, std::move(session), "Vault unlocked");
}

AuthOutcome SessionLockController::submitSecondFactor(std::string_view code)
{
    std::uint64_t attempt{};
    std::string username;
    lockwarden::security::SecureString secret;
    std::optional<CredentialCollection> pending;
    std::optional<SealedVault> sealed;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::AwaitingSecondFactor)
        {
            return NotPermitted{};
        }
        attempt = ++m_attempt;
        username = m_session.username();
        secret = m_pendingSecret;
        pending = m_pendingCollection;
        sealed = m_session.sealed();
    }

    auto login{ m_protocol->loginWithSecondFactor(username, secret, code) };
    auto* token{ std::get_if<SessionToken>(&login) };
    if (token == nullptr)
    {
        if (std::holds_alternative<InvalidCredentials>(login))
        {
            audit(username, "Second factor rejected");
        }
        return convertOutcome<AuthOutcome>(std::move(login));
    }
    auto wipeToken{ lockwarden::security::scopeWipe(token->value) };

    if (!pending.has_value())
    {
        auto opened{ fetchAndOpen(*m_protocol, *m_cipher, *token, secret) };
        if (auto* failure{ std::get_if<AuthOutcome>(&opened) })
        {
            return std::move(*failure);
        }
        auto& vault{ std::get<OpenedVault>(opened) };
        pending = std::move(vault.collection);
        sealed = std::move(vault.sealed);
    }

    Session session{ std::move(username) };
    session.setToken(*token);
    session.setSecret(std::move(secret));
    session.setCollection(std::move(*pending));
    session.setSealed(std::move(sealed));
    return commitUnlocked(attempt, std::move(session), "Second factor verified");
}

std::future<AuthOutcome> SessionLockController::signInAsync(std::string username,
                                                             lockwarden::security::SecureString secret)
{
    return m_executor.submit([this, username = std::move(username), secret = std::move(secret)]() mutable
                             { return signIn(username, std::move(secret)); });
}

std::future<AuthOutcome> SessionLockController::unlockAsync(lockwarden::security::SecureString secret)
{
    return m_executor.submit([this, secret = std::move(secret)]() mutable { return unlock(std::move(secret)); });
}

std::future<AuthOutcome> SessionLockController::submitSecondFactorAsync(std::string code)
{
    return m_executor.submit(
        [this, code = std::move(code)]() mutable
        {
            auto wipeCode{ lockwarden::security::scopeWipe(code) };
            return submitSecondFactor(code);
        });
}

void SessionLockController::cancelSecondFactor()
{
    LockState next{};
    std::string username;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::AwaitingSecondFactor)
        {
            return;
        }
        ++m_attempt;
        clearPending();
        username = m_session.username();
        next = m_cancelTarget;
        if (next == LockState::SignedOut)
        {
            m_session = Session{};
        }
        m_state = next;
    }

    lockwarden::log::info("second factor cancelled for ", username);
    audit(username, "Second factor cancelled");
    notify(next);
}

void SessionLockController::lock()
{
    std::string username;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::Unlocked)
        {
            return;
        }
        lockDown("requested");
        username = m_session.username();
    }

    audit(username, "Session locked");
    notify(LockState::Locked);
}

void SessionLockController::logout()
{
    std::string username;
    bool changed{ false };
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        ++m_attempt;
        m_timer.cancel();
        clearPending();
        username = m_session.username();
        m_session = Session{};
        changed = m_state != LockState::SignedOut;
        m_state = LockState::SignedOut;
    }

    if (changed)
    {
        lockwarden::log::info("signed out ", username);
        audit(username, "User logged out");
        notify(LockState::SignedOut);
    }
}

void SessionLockController::post(HostEvent event)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    switch (event)
    {
    case HostEvent::Activity:
        if (m_foreground && m_state == LockState::Unlocked)
        {
            rearmTimer();
        }
        break;
    case HostEvent::Backgrounded:
        // The countdown keeps running while in the background.
        m_foreground = false;
        break;
    case HostEvent::Foregrounded:
        m_foreground = true;
        if (m_state == LockState::Unlocked)
        {
            rearmTimer();
        }
        break;
    }
}

LockState SessionLockController::state() const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    return m_state;
}

std::string SessionLockController::username() const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    return m_session.username();
}

bool SessionLockController::readCollection(const std::function<void(const CredentialCollection&)>& visitor) const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    if (m_state != LockState::Unlocked)
    {
        return false;
    }
    visitor(m_session.collection());
    return true;
}

CommitOutcome SessionLockController::modifyCollection(const std::function<void(CredentialCollection&)>& mutator)
{
    if (m_committer.load() == std::this_thread::get_id())
    {
        lockwarden::log::warning("vault modification requested from inside a running modification");
        return NotPermitted{};
    }
    const std::lock_guard<std::mutex> serialized{ m_commitMutex };
    const CommitterMark mark{ m_committer };
    return applyModification(mutator);
}

CommitOutcome SessionLockController::applyModification(const std::function<void(CredentialCollection&)>& mutator)
{
    std::uint64_t epoch{};
    std::string username;
    CredentialCollection draft;
    lockwarden::security::SecureString secret;
    SessionToken token;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::Unlocked || !m_session.token().has_value())
        {
            return NotPermitted{};
        }
        epoch = m_attempt;
        username = m_session.username();
        draft = m_session.collection();
        secret = m_session.secret();
        token = *m_session.token();
        rearmTimer();
    }
    auto wipeToken{ lockwarden::security::scopeWipe(token.value) };

    mutator(draft);

    auto sealed{ m_cipher->seal(draft, secret) };
    if (const auto* error{ std::get_if<VaultError>(&sealed) })
    {
        lockwarden::log::error("sealing the vault failed for ", username);
        return *error;
    }
    auto& sealedVault{ std::get<SealedVault>(sealed) };

    auto stored{ m_protocol->storeVault(token, sealedVault) };
    if (!std::holds_alternative<std::monostate>(stored))
    {
        return convertOutcome<CommitOutcome>(std::move(stored));
    }

    bool superseded{ false };
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        // The remote copy changed either way; a later unlock must see it.
        if (m_session.username() == username && m_state != LockState::SignedOut)
        {
            m_session.setSealed(sealedVault);
        }
        superseded = epoch != m_attempt || m_state != LockState::Unlocked;
        if (!superseded)
        {
            m_session.setCollection(std::move(draft));
        }
    }

    if (superseded)
    {
        lockwarden::log::warning("vault stored after the session changed; in-memory collection left as is");
        return Superseded{};
    }
    audit(username, "Vault saved");
    return std::monostate{};
}

EnrollOutcome SessionLockController::enrollSecondFactor()
{
    std::string username;
    SessionToken token;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::Unlocked || !m_session.token().has_value())
        {
            return NotPermitted{};
        }
        username = m_session.username();
        token = *m_session.token();
        rearmTimer();
    }
    auto wipeToken{ lockwarden::security::scopeWipe(token.value) };

    auto enrollment{ m_protocol->enrollSecondFactor(token) };
    if (std::holds_alternative<SecondFactorEnrollment>(enrollment))
    {
        audit(username, "Second factor enrollment started");
    }
    return convertOutcome<EnrollOutcome>(std::move(enrollment));
}

ToggleOutcome SessionLockController::confirmSecondFactor(std::string_view code)
{
    std::string username;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::Unlocked)
        {
            return NotPermitted{};
        }
        username = m_session.username();
        rearmTimer();
    }

    auto verified{ m_protocol->verifySecondFactor(username, code) };
    if (const auto* accepted{ std::get_if<bool>(&verified) }; accepted != nullptr && *accepted)
    {
        audit(username, "Second factor enabled");
    }
    return convertOutcome<ToggleOutcome>(std::move(verified));
}

ToggleOutcome SessionLockController::disableSecondFactor()
{
    std::string username;
    SessionToken token;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (m_state != LockState::Unlocked || !m_session.token().has_value())
        {
            return NotPermitted{};
        }
        username = m_session.username();
        token = *m_session.token();
        rearmTimer();
    }
    auto wipeToken{ lockwarden::security::scopeWipe(token.value) };

    auto disabled{ m_protocol->disableSecondFactor(token) };
    if (const auto* done{ std::get_if<bool>(&disabled) }; done != nullptr && *done)
    {
        audit(username, "Second factor disabled");
    }
    return convertOutcome<ToggleOutcome>(std::move(disabled));
}

void SessionLockController::setStateListener(StateListener listener)
{
    const std::lock_guard<std::mutex> guard{ m_listenerMutex };
    m_listener = std::move(listener);
}

void SessionLockController::onIdleExpired(IdleTimer::Generation generation) noexcept
{
    try
    {
        std::string username;
        {
            const std::lock_guard<std::mutex> guard{ m_mutex };
            if (generation != m_timerGeneration || m_state != LockState::Unlocked)
            {
                return;
            }
            lockDown("inactivity");
            username = m_session.username();
        }

        audit(username, "Session locked after inactivity");
        notify(LockState::Locked);
    }
    catch (const std::exception& e)
    {
        lockwarden::log::error("inactivity lock: ", e.what());
    }
}

AuthOutcome SessionLockController::commitUnlocked(std::uint64_t attempt, Session session, std::string_view action)
{
    std::string username;
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (attempt != m_attempt)
        {
            lockwarden::log::debug("discarding superseded attempt ", attempt);
            return Superseded{};
        }
        clearPending();
        m_session = std::move(session);
        m_state = LockState::Unlocked;
        rearmTimer();
        username = m_session.username();
    }

    lockwarden::log::info("vault unlocked for ", username);
    audit(username, action);
    notify(LockState::Unlocked);
    return std::monostate{};
}

AuthOutcome SessionLockController::commitAwaiting(std::uint64_t attempt, std::string_view username, LockState origin,
                                                  lockwarden::security::SecureString secret,
                                                  std::optional<CredentialCollection> opened)
{
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        if (attempt != m_attempt)
        {
            lockwarden::log::debug("discarding superseded attempt ", attempt);
            return Superseded{};
        }
        if (origin == LockState::SignedOut)
        {
            m_session = Session{ std::string{ username } };
        }
        clearPending();
        m_pendingSecret = std::move(secret);
        m_pendingCollection = std::move(opened);
        m_cancelTarget = origin;
        m_state = LockState::AwaitingSecondFactor;
    }

    lockwarden::log::info("second factor required for ", username);
    audit(username, "Second factor required");
    notify(LockState::AwaitingSecondFactor);
    return MfaRequired{};
}

// Caller holds m_mutex.
void SessionLockController::lockDown(std::string_view reason)
{
    ++m_attempt;
    m_timer.cancel();
    clearPending();
    m_session.lockDown();
    m_state = LockState::Locked;
    lockwarden::log::info("session locked (", reason, ") for ", m_session.username());
}

// Caller holds m_mutex.
void SessionLockController::rearmTimer()
{
    if (m_config.idleTimeout <= std::chrono::milliseconds::zero())
    {
        return;
    }
    m_timerGeneration = m_timer.arm(m_config.idleTimeout);
}

void SessionLockController::clearPending() noexcept
{
    lockwarden::security::secureRelease(m_pendingSecret);
    if (m_pendingCollection.has_value())
    {
        m_pendingCollection->clear();
        m_pendingCollection.reset();
    }
}

void SessionLockController::notify(LockState state)
{
    StateListener listener;
    {
        const std::lock_guard<std::mutex> guard{ m_listenerMutex };
        listener = m_listener;
    }
    if (listener)
    {
        listener(state);
    }
}

void SessionLockController::audit(std::string_view username, std::string_view action) const noexcept
{
    if (username.empty())
    {
        return;
    }
    try
    {
        m_audit->record(username, action);
    }
    catch (const std::exception& e)
    {
        lockwarden::log::warning("audit record failed: ", e.what());
    }
}

} // namespace lockwarden::core
