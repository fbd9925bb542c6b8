#pragma once

namespace farmlink
{

// Host notification collaborator.
// Contract: notify() is fire-and-forget and never throws; failures stay inside the implementation.
class Notifier
{
public:
    virtual ~Notifier() = default;
    virtual bool isPermissionGranted() const = 0;
    virtual void notify(const char *title, const char *body) = 0;
};

// Prints notifications to stdout with a terminal bell.
class TerminalNotifier : public Notifier
{
public:
    explicit TerminalNotifier(bool permissionGranted) : granted_(permissionGranted) {}

    bool isPermissionGranted() const override { return granted_; }
    void notify(const char *title, const char *body) override;

    void setPermissionGranted(bool granted) { granted_ = granted; }

private:
    bool granted_;
};

} // namespace farmlink
