#include "OwnershipTransfer.hpp"

#include "Pool/PoolErrors.hpp"

OwnershipTransfer::OwnershipTransfer(std::shared_ptr<IPoolStore> store,
									 std::shared_ptr<IWorkspaceHooks> hooks,
									 std::shared_ptr<IdentityRegistry> registry)
	: Store(std::move(store)), Hooks(std::move(hooks)), Registry(std::move(registry))
{
	if (!Store || !Registry)
	{
		throw std::invalid_argument("OwnershipTransfer needs a store and a registry");
	}
}

std::optional<Workspace> OwnershipTransfer::ClaimOnSignup(ISession& session,
														  const std::string& newAccount)
{
	const auto token = session.Get(SessionKeys::kToken);
	if (!token)
	{
		logger->DebugFormatted("No visitor workspace to claim for {}", newAccount);
		return std::nullopt;
	}

	const TimeUs now = Store->NowUs();
	const auto slot = Store->FindLiveSlot(*token, now);
	if (!slot)
	{
		logger->WarningFormatted("No live visitor lease to claim for {} (token {}...)", newAccount,
								 token->substr(0, 8));
		return std::nullopt;
	}

	std::optional<std::string> movedTo;
	TransferOutcome outcome;
	try
	{
		outcome = Store->TransferWorkspace(
			*token, newAccount, now,
			[&](const LeasedSlot& held) -> std::string
			{
				if (!Hooks)
					return {};
				std::string location =
					Hooks->OnOwnershipTransfer(held.workspace, held.identity.Account, newAccount);
				movedTo = location;
				return location;
			});
	}
	catch (const PoolStorageError&)
	{
		// The commit may not have happened; put the files back where the store has them.
		RevertMove(slot->workspace, movedTo);
		throw;
	}
	catch (const std::exception& e)
	{
		logger->ErrorFormatted("Error claiming workspace {} for {}: {}", slot->workspace.ID,
							   newAccount, e.what());
		return std::nullopt;
	}

	if (outcome != TransferOutcome::eTransferred)
	{
		RevertMove(slot->workspace, movedTo);
		logger->WarningFormatted("Workspace {} not transferred to {}: {}", slot->workspace.ID,
								 newAccount, boost::describe::enum_to_string(outcome, "INVALID"));
		return std::nullopt;
	}

	session.ClearVisitor();

	Workspace claimed = slot->workspace;
	claimed.Owner = newAccount;
	if (movedTo && !movedTo->empty())
		claimed.Location = *movedTo;
	logger->DebugFormatted("Claimed workspace {} for {} from {}", claimed.ID, newAccount,
						   slot->identity.Account);

	// The identity no longer owns a workspace; give it a fresh one unless a
	// concurrent init already did.
	try
	{
		if (!Registry->ProvisionSlot(slot->identity.Number, claimed.ID))
		{
			logger->DebugFormatted("{} was re-paired concurrently", slot->identity.Account);
		}
	}
	catch (const std::exception& e)
	{
		logger->WarningFormatted("Re-pairing {} failed, slot stays out of rotation until the next init: {}",
								 slot->identity.Account, e.what());
	}
	return claimed;
}

void OwnershipTransfer::RevertMove(const Workspace& workspace,
								   const std::optional<std::string>& movedTo)
{
	if (!Hooks || !movedTo || movedTo->empty())
		return;
	try
	{
		Hooks->RevertOwnershipTransfer(workspace, *movedTo);
	}
	catch (const std::exception& e)
	{
		logger->ErrorFormatted("Workspace {} left at {} after an aborted transfer: {}", workspace.ID,
							   *movedTo, e.what());
	}
}
