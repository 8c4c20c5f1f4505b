#pragma once

#include <rstate/rstate_base.h>

namespace rstate
{
    /**
     * Anything that can be told one of the fields it subscribes to has changed.
     */
    struct Notifiable {
        virtual ~Notifiable() = default;

        virtual void notify() = 0;
    };
}
