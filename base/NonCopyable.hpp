// 不可拷贝混入类 (Non-copyable Mixin)
// 参考: https://en.wikibooks.org/wiki/More_C%2B%2B_Idioms/Non-copyable_Mixin
#ifndef _CLRPSA_NONCOPYABLE_HPP_
#define _CLRPSA_NONCOPYABLE_HPP_

namespace clrpsa {

    // Non-copyable mixin. Objects deriving from it can be moved (constructed) but never copied.
    // 禁止拷贝，允许移动构造
    //
    // The Instance derives from it: it is built once, shared read-only by every solver run (also across threads) and must never be
    // duplicated by accident.
    // Instance继承此类：只构建一次，被所有求解过程只读共享
    template <class T>
    class NonCopyable {
    public:
        NonCopyable(const NonCopyable&) = delete;
        NonCopyable(NonCopyable&&) noexcept = default;
        NonCopyable& operator=(const NonCopyable&) = delete;
        NonCopyable& operator=(NonCopyable&&) noexcept = delete;

    protected:
        NonCopyable() = default;
        ~NonCopyable() = default;  // 受保护的非虚析构函数
    };

}  // namespace clrpsa

#endif
