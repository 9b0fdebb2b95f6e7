#pragma once
#include <memory>

#include "Debug/Log.hpp"
#include "Pool/Database/IPoolStore.hpp"
#include "Pool/Workspace/IWorkspaceHooks.hpp"

/**
 * @brief The fixed set of visitor identities and their default workspaces.
 */
class IdentityRegistry
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("IdentityRegistry");
	std::shared_ptr<IPoolStore> Store;
	std::shared_ptr<IWorkspaceHooks> Hooks;

   public:
	static constexpr std::string_view kDefaultWorkspaceName = "default-project";
	static constexpr std::chrono::milliseconds kAdminLockTTL{60000};

	IdentityRegistry(std::shared_ptr<IPoolStore> store, std::shared_ptr<IWorkspaceHooks> hooks);

	/**
	 * @brief Make sure identities 1..n exist, each owning its default workspace.
	 * @details Runs under the store's admin lock. Slots that already pair up
	 * are left alone, so repeated runs only provision what is missing.
	 * @return Number of slots provisioned by this call.
	 * @throws PoolBootstrapError when n is out of range or the lock is held.
	 */
	uint32_t InitializePool(uint32_t n);

	/**
	 * @brief Creates a fresh default workspace for slot @p number and points the
	 * identity at it.
	 * @param expectedWorkspace Workspace the identity is known to point at now
	 * (empty for an identity that does not exist yet).
	 * @return Empty when the identity was re-paired by someone else meanwhile.
	 */
	std::optional<VisitorIdentity> ProvisionSlot(IdentityNumber number,
												 std::optional<WorkspaceID> expectedWorkspace);

   private:
	[[nodiscard]] bool IsPaired(const std::optional<VisitorIdentity>& identity);
};
