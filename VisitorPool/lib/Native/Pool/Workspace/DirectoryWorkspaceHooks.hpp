#pragma once
#include <atomic>
#include <filesystem>

#include "Debug/Log.hpp"
#include "Pool/Workspace/IWorkspaceHooks.hpp"

// Workspaces as directories: <root>/<account>/default-project-<seq>, seeded
// from the template directory when it exists. A transfer moves the directory
// under the new account.
class DirectoryWorkspaceHooks : public IWorkspaceHooks
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("WorkspaceHooks");
	std::filesystem::path Root;
	std::filesystem::path Template;
	std::atomic<uint64_t> Sequence{0};

	/// First path under @p dir named @p stem, @p stem-2, ... that does not exist.
	static std::filesystem::path FreeName(const std::filesystem::path& dir, const std::string& stem);

   public:
	DirectoryWorkspaceHooks(std::filesystem::path root, std::filesystem::path templateDir);

	std::string ProvisionDefaultWorkspace(const std::string& account) override;
	std::string OnOwnershipTransfer(const Workspace& workspace, const std::string& fromAccount,
									const std::string& toAccount) override;
	void RevertOwnershipTransfer(const Workspace& workspace, const std::string& movedTo) override;
	void OnReclaim(const VisitorIdentity& identity, const Workspace& workspace) override;
};
