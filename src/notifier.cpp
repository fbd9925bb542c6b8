#include "farmlink/notifier.h"

#include <stdio.h>

namespace farmlink
{

void TerminalNotifier::notify(const char *title, const char *body)
{
    const int written = fprintf(stdout, "\a[%s] %s\n", title ? title : "", body ? body : "");
    if (written > 0)
    {
        fflush(stdout);
    }
}

} // namespace farmlink
