#pragma once
#include <string>

#include "Pool/PoolTypes.hpp"

/**
 * @brief Boundary to whatever owns workspace contents.
 * @details The pool only tracks ownership; provisioning, moving and resetting
 * the actual files happens behind these calls.
 */
class IWorkspaceHooks
{
   public:
	virtual ~IWorkspaceHooks() = default;

	/// Creates the default workspace for @p account and returns its location.
	[[nodiscard]] virtual std::string ProvisionDefaultWorkspace(const std::string& account) = 0;

	/**
	 * @brief Move @p workspace into @p toAccount's space.
	 * @details Runs inside the transfer transaction and returns the new
	 * location, which commits together with the owner change. Throwing aborts
	 * the transfer. In-process stores hold their lock during this call, so it
	 * must not call back into the pool or its store.
	 */
	[[nodiscard]] virtual std::string OnOwnershipTransfer(const Workspace& workspace,
														  const std::string& fromAccount,
														  const std::string& toAccount) = 0;

	/// Undoes OnOwnershipTransfer when the transaction did not commit.
	virtual void RevertOwnershipTransfer(const Workspace& workspace, const std::string& movedTo) = 0;

	/// A lease on @p identity ended (reclaimed or released).
	virtual void OnReclaim(const VisitorIdentity& identity, const Workspace& workspace) = 0;
};
