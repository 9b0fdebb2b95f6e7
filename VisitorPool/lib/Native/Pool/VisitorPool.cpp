#include "VisitorPool.hpp"

VisitorPool::VisitorPool(std::shared_ptr<IPoolStore> store, std::shared_ptr<IWorkspaceHooks> hooks,
						 const PoolConfig& config)
	: Store(std::move(store)), Hooks(std::move(hooks)), PoolSize(config.PoolSize)
{
	config.Validate();

	Registry = std::make_shared<IdentityRegistry>(Store, Hooks);
	Reclaimer = std::make_shared<LeaseReclaimer>(Store, Hooks);
	Allocator = std::make_shared<LeaseAllocator>(
		Store, Reclaimer, PoolSize,
		std::chrono::duration_cast<std::chrono::microseconds>(config.LeaseLifetime));
	Transfer = std::make_shared<OwnershipTransfer>(Store, Hooks, Registry);
	Observer = std::make_shared<PoolObserver>(Store, PoolSize);
}

uint32_t VisitorPool::InitializePool(std::optional<uint32_t> n)
{
	return Registry->InitializePool(n.value_or(PoolSize));
}
