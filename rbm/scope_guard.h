// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef SCOPE_GUARD_H_3948572094385720
#define SCOPE_GUARD_H_3948572094385720

#include <exception>
#include <type_traits>
#include <utility>


namespace rbm
{
/*  Scope Guard
        auto guardFile = rbm::makeGuard<ScopeGuardRunMode::onFail>([&] { ::unlink(tmpPath.c_str()); });
            ...
        guardFile.dismiss();

    Scope Exit:
        RBM_ON_SCOPE_EXIT   (cleanUp());
        RBM_ON_SCOPE_FAIL   (undoTemporaryWork());
        RBM_ON_SCOPE_SUCCESS(notifySuccess());

    onExit/onFail functors run during stack unwinding => they must not throw!          */
enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode != ScopeGuardRunMode::onSuccess)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onExit)
            fun_(); //noexcept
        else if constexpr (runMode == ScopeGuardRunMode::onSuccess)
        {
            if (!failed)
                fun_(); //throw X
        }
        else
        {
            if (failed)
                fun_(); //noexcept
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define RBM_CONCAT_SUB(X, Y) X ## Y
#define RBM_CONCAT(X, Y) RBM_CONCAT_SUB(X, Y)

#define RBM_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto RBM_CONCAT(scopeGuard, __LINE__) = rbm::makeGuard<rbm::ScopeGuardRunMode::onExit   >([&]{ X; });
#define RBM_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto RBM_CONCAT(scopeGuard, __LINE__) = rbm::makeGuard<rbm::ScopeGuardRunMode::onFail   >([&]{ X; });
#define RBM_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto RBM_CONCAT(scopeGuard, __LINE__) = rbm::makeGuard<rbm::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_3948572094385720
