#ifndef EITHER_H
#define EITHER_H

#include <stdexcept>
#include <utility>
#include <variant>

//!
//! \brief A result type holding either a value or an error, never both.
//! \tparam R The right type, the successful result.
//! \tparam L The left type, the error.
//!
template <typename R, typename L>
class Either
{
public:
    Either(L left)
        : value(std::in_place_index<0>, std::move(left)) { }

    Either(R right)
        : value(std::in_place_index<1>, std::move(right)) { }

    bool isLeft() const
    {
        return value.index() == 0;
    }

    bool isRight() const
    {
        return value.index() == 1;
    }

    const L& getLeft() const
    {
        if (!isLeft())
            throw std::logic_error("Either::getLeft() called on a right value.");

        return std::get<0>(value);
    }

    const R& getRight() const
    {
        if (isLeft())
            throw std::logic_error("Either::getRight() called on a left value.");

        return std::get<1>(value);
    }

    template <typename F, typename G>
    auto fold(F&& rightFunc, G&& leftFunc) const
    {
        return isLeft() ? leftFunc(getLeft()) : rightFunc(getRight());
    }

private:
    std::variant<L, R> value;
};

#endif
