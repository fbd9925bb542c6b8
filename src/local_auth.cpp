#include "farmlink/local_auth.h"

#include <stdio.h>

#include "farmlink/logger.h"

namespace farmlink
{

static constexpr const char *kSignInFailedReason = "auth/network-request-failed";

LocalAuth::LocalAuth(const Clock &clock, const LocalAuthOptions &options)
    : clock_(clock), retryMs_(options.retryMs), failuresLeft_(options.failAttempts),
      signedIn_(options.existingSession)
{
    if (signedIn_)
    {
        newUid();
    }
}

AuthListenerId LocalAuth::onAuthChange(AuthListener listener)
{
    const AuthListenerId id = nextListenerId_++;
    listeners_.push_back(Listener{id, std::move(listener), false});
    return id;
}

void LocalAuth::removeAuthListener(AuthListenerId id)
{
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it)
    {
        if (it->id == id)
        {
            listeners_.erase(it);
            return;
        }
    }
}

void LocalAuth::signInAnonymously(SignInCallback done)
{
    pendingSignIns_.push_back(std::move(done));
}

void LocalAuth::signOut()
{
    if (!signedIn_)
    {
        return;
    }
    signedIn_ = false;
    FARMLINK_LOG_INFO(LogDomain::AUTH, "signed out %s", uid_.c_str());
    uid_.clear();
    announce(false);
}

void LocalAuth::announce(bool hasSession)
{
    FARMLINK_LOG_DEBUG(LogDomain::AUTH, "auth state -> %s", hasSession ? "session" : "no session");
    for (Listener &l : listeners_)
    {
        l.announced = false;
    }
}

void LocalAuth::newUid()
{
    char buf[32];
    snprintf(buf, sizeof(buf), "anon-%08lx%04x", (unsigned long)(clock_.nowMs() & 0xFFFFFFFFu),
             (unsigned)(attempts_ & 0xFFFFu));
    uid_ = buf;
}

size_t LocalAuth::poll()
{
    size_t fired = 0;

    std::vector<SignInCallback> attempts;
    attempts.swap(pendingSignIns_);
    for (SignInCallback &done : attempts)
    {
        ++attempts_;
        AuthOutcome outcome;
        if (failuresLeft_ > 0)
        {
            --failuresLeft_;
            outcome.reason = kSignInFailedReason;
            FARMLINK_LOG_WARN(LogDomain::AUTH, "sign-in attempt %u failed (%u more to fail)", (unsigned)attempts_,
                              (unsigned)failuresLeft_);
            if (retryMs_ > 0)
            {
                retryArmed_ = true;
                retryAtMs_ = clock_.nowMs() + retryMs_;
            }
        }
        else
        {
            outcome.ok = true;
            if (!signedIn_)
            {
                signedIn_ = true;
                newUid();
                FARMLINK_LOG_INFO(LogDomain::AUTH, "signed in anonymously as %s", uid_.c_str());
                announce(true);
            }
        }
        if (done)
        {
            done(outcome);
            ++fired;
        }
    }

    if (retryArmed_ && clock_.nowMs() >= retryAtMs_)
    {
        retryArmed_ = false;
        if (!signedIn_)
        {
            announce(false);
        }
    }

    // Listeners may add or remove listeners while being notified.
    std::vector<AuthListenerId> due;
    for (const Listener &l : listeners_)
    {
        if (!l.announced)
        {
            due.push_back(l.id);
        }
    }
    for (const AuthListenerId id : due)
    {
        for (Listener &l : listeners_)
        {
            if (l.id != id)
            {
                continue;
            }
            l.announced = true;
            AuthListener fn = l.fn;
            fn(signedIn_);
            ++fired;
            break;
        }
    }
    return fired;
}

} // namespace farmlink
