#include "IdentityRegistry.hpp"

#include <unistd.h>

#include "Pool/LeaseToken.hpp"
#include "Pool/PoolConfig.hpp"
#include "Pool/PoolErrors.hpp"

namespace
{
class AdminLockGuard
{
	IPoolStore& Store;
	std::string Owner;
	Log& Logger;

   public:
	AdminLockGuard(IPoolStore& store, std::string owner, Log& logger)
		: Store(store), Owner(std::move(owner)), Logger(logger)
	{
	}
	AdminLockGuard(const AdminLockGuard&) = delete;
	AdminLockGuard& operator=(const AdminLockGuard&) = delete;
	~AdminLockGuard()
	{
		try
		{
			Store.ReleaseAdminLock(Owner);
		}
		catch (const PoolStorageError& e)
		{
			// The lock expires on its own.
			Logger.WarningFormatted("Failed to release admin lock {}: {}", Owner, e.what());
		}
	}
};
}  // namespace

IdentityRegistry::IdentityRegistry(std::shared_ptr<IPoolStore> store,
								   std::shared_ptr<IWorkspaceHooks> hooks)
	: Store(std::move(store)), Hooks(std::move(hooks))
{
	if (!Store || !Hooks)
	{
		throw std::invalid_argument("IdentityRegistry needs a store and workspace hooks");
	}
}

bool IdentityRegistry::IsPaired(const std::optional<VisitorIdentity>& identity)
{
	if (!identity)
		return false;
	const auto ws = Store->GetWorkspace(identity->Workspace);
	return ws && ws->Owner == VisitorIdentity::AccountName(identity->Number);
}

std::optional<VisitorIdentity> IdentityRegistry::ProvisionSlot(
	IdentityNumber number, std::optional<WorkspaceID> expectedWorkspace)
{
	VisitorIdentity identity;
	identity.Number = number;
	identity.Account = VisitorIdentity::AccountName(number);

	std::string location;
	try
	{
		location = Hooks->ProvisionDefaultWorkspace(identity.Account);
	}
	catch (const PoolStorageError&)
	{
		throw;
	}
	catch (const std::exception& e)
	{
		throw PoolBootstrapError(
			std::format("Provisioning workspace for {} failed: {}", identity.Account, e.what()));
	}

	const Workspace ws =
		Store->CreateWorkspace(identity.Account, std::string(kDefaultWorkspaceName), location);
	identity.Workspace = ws.ID;
	if (!Store->PairIdentity(identity, expectedWorkspace))
	{
		logger->WarningFormatted("{} changed while provisioning, workspace {} at {} left unused",
								 identity.Account, ws.ID, ws.Location);
		return std::nullopt;
	}

	logger->DebugFormatted("Paired {} with workspace {} at {}", identity.Account, ws.ID, ws.Location);
	return identity;
}

uint32_t IdentityRegistry::InitializePool(uint32_t n)
{
	if (n == 0 || n > PoolConfig::kMaxPoolSize)
	{
		throw PoolBootstrapError(
			std::format("Pool size must be within 1..{}, got {}", PoolConfig::kMaxPoolSize, n));
	}

	const std::string owner =
		std::format("bootstrap-{}-{}", ::getpid(), LeaseToken::Generate().substr(0, 16));
	if (!Store->AcquireAdminLock(owner, kAdminLockTTL))
	{
		throw PoolBootstrapError("Another bootstrap holds the admin lock");
	}
	AdminLockGuard guard(*Store, owner, *logger);

	uint32_t created = 0;
	for (IdentityNumber i = 1; i <= n; ++i)
	{
		const auto identity = Store->GetIdentity(i);
		if (IsPaired(identity))
			continue;
		const std::optional<WorkspaceID> current =
			identity ? std::optional<WorkspaceID>(identity->Workspace) : std::nullopt;
		if (ProvisionSlot(i, current))
			++created;
	}

	logger->DebugFormatted("Pool initialized: {} slot(s) requested, {} provisioned", n, created);
	return created;
}
