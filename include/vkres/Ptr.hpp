#ifndef VKRES_PTR_HPP
#define VKRES_PTR_HPP

#include <memory>

namespace vkres {
template <typename T> using Ptr = std::shared_ptr<const T>;
} // namespace vkres

#endif // VKRES_PTR_HPP
