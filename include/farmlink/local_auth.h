#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "farmlink/auth.h"
#include "farmlink/config.h"
#include "farmlink/task_scheduler.h"

namespace farmlink
{

struct LocalAuthOptions
{
    bool existingSession = false; // a session survives from a previous run
    uint8_t failAttempts = 0;     // sign-in attempts to fail before one succeeds
    uint32_t retryMs = FARMLINK_CFG_AUTH_RETRY_MS; // 0 disables the retry notice
};

// Host-side anonymous identity provider.
// After a failed sign-in it re-announces "no session" once retryMs elapse, which is
// how the session gets prompted to try again.
class LocalAuth : public AuthProvider
{
public:
    LocalAuth(const Clock &clock, const LocalAuthOptions &options);

    AuthListenerId onAuthChange(AuthListener listener) override;
    void removeAuthListener(AuthListenerId id) override;
    void signInAnonymously(SignInCallback done) override;

    // Delivers queued notifications and resolves sign-in attempts. Returns callbacks fired.
    size_t poll();

    // Drops the session and tells every listener.
    void signOut();

    // Test/console hook: fail the next n attempts.
    void failNext(uint8_t attempts) { failuresLeft_ = attempts; }

    bool isSignedIn() const { return signedIn_; }
    const std::string &uid() const { return uid_; }
    uint32_t signInAttempts() const { return attempts_; }
    size_t listenerCount() const { return listeners_.size(); }

private:
    struct Listener
    {
        AuthListenerId id;
        AuthListener fn;
        bool announced;
    };

    void announce(bool hasSession);
    void newUid();

    const Clock &clock_;
    uint32_t retryMs_;
    std::vector<Listener> listeners_;
    std::vector<SignInCallback> pendingSignIns_;
    AuthListenerId nextListenerId_ = 1;
    uint8_t failuresLeft_;
    bool signedIn_;
    bool retryArmed_ = false;
    uint64_t retryAtMs_ = 0;
    uint32_t attempts_ = 0;
    std::string uid_;
};

} // namespace farmlink
