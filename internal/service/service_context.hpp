#pragma once

#include <memory>

namespace blockforge::core { class BlockManager; }

namespace blockforge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<blockforge::core::BlockManager> manager;
};

}
