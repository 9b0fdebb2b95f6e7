#include "DirectoryWorkspaceHooks.hpp"

#include <system_error>

DirectoryWorkspaceHooks::DirectoryWorkspaceHooks(std::filesystem::path root,
												 std::filesystem::path templateDir)
	: Root(std::move(root)), Template(std::move(templateDir))
{
}

std::string DirectoryWorkspaceHooks::ProvisionDefaultWorkspace(const std::string& account)
{
	namespace fs = std::filesystem;
	const fs::path accountDir = Root / account;
	fs::create_directories(accountDir);

	// Pick a directory that does not exist yet; earlier runs may have left some.
	fs::path target;
	do
	{
		target = accountDir / std::format("default-project-{}", ++Sequence);
	} while (fs::exists(target));

	std::error_code ec;
	if (fs::is_directory(Template, ec))
	{
		fs::copy(Template, target, fs::copy_options::recursive);
		logger->DebugFormatted("Provisioned {} from template {}", target.string(), Template.string());
	}
	else
	{
		fs::create_directories(target);
		logger->WarningFormatted("Template {} missing, provisioned empty workspace {}",
								 Template.string(), target.string());
	}
	return target.string();
}

std::filesystem::path DirectoryWorkspaceHooks::FreeName(const std::filesystem::path& dir,
														const std::string& stem)
{
	std::filesystem::path candidate = dir / stem;
	for (uint32_t n = 2; std::filesystem::exists(candidate); ++n)
	{
		candidate = dir / std::format("{}-{}", stem, n);
	}
	return candidate;
}

std::string DirectoryWorkspaceHooks::OnOwnershipTransfer(const Workspace& workspace,
														 const std::string& fromAccount,
														 const std::string& toAccount)
{
	namespace fs = std::filesystem;
	std::error_code ec;
	if (!fs::is_directory(workspace.Location, ec))
	{
		throw std::runtime_error(std::format("Workspace {} has no directory at '{}'", workspace.ID,
											 workspace.Location));
	}

	const fs::path accountDir = Root / toAccount;
	fs::create_directories(accountDir);
	const fs::path target =
		FreeName(accountDir, workspace.Name.empty() ? std::format("workspace-{}", workspace.ID)
													: workspace.Name);
	fs::rename(workspace.Location, target);

	logger->DebugFormatted("Workspace {} moved from {} ({}) to {} ({})", workspace.ID,
						   workspace.Location, fromAccount, target.string(), toAccount);
	return target.string();
}

void DirectoryWorkspaceHooks::RevertOwnershipTransfer(const Workspace& workspace,
													  const std::string& movedTo)
{
	std::filesystem::rename(movedTo, workspace.Location);
	logger->WarningFormatted("Workspace {} moved back to {}", workspace.ID, workspace.Location);
}

void DirectoryWorkspaceHooks::OnReclaim(const VisitorIdentity& identity, const Workspace& workspace)
{
	// Contents are kept as-is for the next visitor.
	logger->DebugFormatted("Slot {} returned with workspace {} at {}", identity.Account,
						   workspace.ID, workspace.Location);
}
