#pragma once
#include <memory>

#include "Debug/Log.hpp"
#include "Pool/Database/IPoolStore.hpp"
#include "Pool/IdentityRegistry.hpp"
#include "Pool/Session/ISession.hpp"
#include "Pool/Workspace/IWorkspaceHooks.hpp"

/**
 * @brief Gives a visitor's workspace to the account they just signed up with.
 * @details Owner and location change, workspace hook and lease deactivation
 * commit as one transaction. A workspace moved by the hook is moved back when
 * the transaction does not commit. Afterwards the visitor identity is paired with a fresh
 * workspace so the slot can be handed out again.
 */
class OwnershipTransfer
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("OwnershipTransfer");
	std::shared_ptr<IPoolStore> Store;
	std::shared_ptr<IWorkspaceHooks> Hooks;
	std::shared_ptr<IdentityRegistry> Registry;

   public:
	OwnershipTransfer(std::shared_ptr<IPoolStore> store, std::shared_ptr<IWorkspaceHooks> hooks,
					  std::shared_ptr<IdentityRegistry> registry);

	/// The transferred workspace, or empty when the session had nothing to claim.
	std::optional<Workspace> ClaimOnSignup(ISession& session, const std::string& newAccount);

   private:
	void RevertMove(const Workspace& workspace, const std::optional<std::string>& movedTo);
};
