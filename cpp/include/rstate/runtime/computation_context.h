#ifndef RSTATE_COMPUTATION_CONTEXT_H
#define RSTATE_COMPUTATION_CONTEXT_H

#include <rstate/rstate_base.h>

#include <optional>
#include <vector>

namespace rstate {

    /**
     * @brief Which computation (if any) is currently running.
     *
     * Reads are attributed to the top of the stack only, so a computation run from inside another (a derived value
     * recomputed on read, an effect triggered by a write) takes the attributions until it is popped, after which
     * the outer computation receives them again.
     *
     * An invalid ComputationId on top of the stack is an untracked frame: reads made under it are not attributed
     * to anyone.
     */
    struct RSTATE_EXPORT ComputationContext {
        void push(ComputationId id);

        void pop();

        /**
         * The computation reads are attributed to, nullopt outside any computation or inside an untracked frame.
         */
        [[nodiscard]] std::optional<ComputationId> current() const;

        [[nodiscard]] bool is_tracking() const { return current().has_value(); }

        [[nodiscard]] bool contains(ComputationId id) const;

        [[nodiscard]] size_t depth() const { return _stack.size(); }

    private:
        std::vector<ComputationId> _stack{};
    };

    /**
     * Pushes a frame for the life-time of the guard, the frame is popped also when the run throws.
     */
    struct ContextFrame {
        ContextFrame(ComputationContext &context, ComputationId id) : _context{context} { _context.push(id); }

        ~ContextFrame() { _context.pop(); }

        ContextFrame(const ContextFrame &) = delete;

        ContextFrame &operator=(const ContextFrame &) = delete;

    private:
        ComputationContext &_context;
    };

} // namespace rstate

#endif  // RSTATE_COMPUTATION_CONTEXT_H
