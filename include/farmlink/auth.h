#pragma once
#include <functional>
#include <stdint.h>
#include <string>

namespace farmlink
{

struct AuthOutcome
{
    bool ok = false;
    std::string reason; // empty when ok
};

using AuthListener = std::function<void(bool hasSession)>;
using AuthListenerId = uint32_t;
using SignInCallback = std::function<void(const AuthOutcome &)>;

static constexpr AuthListenerId kInvalidAuthListener = 0;

// Identity bootstrap collaborator.
// Contract: listeners and sign-in callbacks are invoked from the owner's loop, never
// re-entrantly from onAuthChange() or signInAnonymously().
class AuthProvider
{
public:
    virtual ~AuthProvider() = default;

    // The listener is told the current session state once, then on every change.
    virtual AuthListenerId onAuthChange(AuthListener listener) = 0;
    virtual void removeAuthListener(AuthListenerId id) = 0;

    virtual void signInAnonymously(SignInCallback done) = 0;
};

} // namespace farmlink
