#include "breeze/resource-context.hpp"

#include <memory>

#include "breeze/app-config.hpp"
#include "breeze/log.hpp"

namespace breeze {

std::shared_ptr<const ResourceContext> ResourceContext::Default() {
  return std::make_shared<const ResourceContext>(ResourceContext{log::default_logger(), AppConfig{}});
}

}  // namespace breeze
