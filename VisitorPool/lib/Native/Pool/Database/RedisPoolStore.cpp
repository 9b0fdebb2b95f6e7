#include "RedisPoolStore.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <type_traits>

#include "Pool/PoolErrors.hpp"

namespace
{
uint64_t ParseU64(std::string_view text, std::string_view what)
{
	uint64_t value = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size())
	{
		throw PoolStorageError(std::format("Malformed {} in store: '{}'", what, text));
	}
	return value;
}

std::string FieldOr(const std::unordered_map<std::string, std::string>& fields,
					const std::string& name)
{
	auto it = fields.find(name);
	return it == fields.end() ? std::string() : it->second;
}

Lease LeaseFromFields(LeaseID id, const std::unordered_map<std::string, std::string>& fields)
{
	Lease lease;
	lease.ID = id;
	lease.Identity = static_cast<IdentityNumber>(ParseU64(FieldOr(fields, "identity"), "lease identity"));
	lease.Token = FieldOr(fields, "token");
	lease.SessionKey = FieldOr(fields, "session");
	lease.CreatedAtUs = ParseU64(FieldOr(fields, "created_us"), "lease created_us");
	lease.ExpiresAtUs = ParseU64(FieldOr(fields, "expires_us"), "lease expires_us");
	lease.Active = FieldOr(fields, "active") == "1";
	return lease;
}

std::optional<VisitorIdentity> IdentityFromFields(
	IdentityNumber number, const std::unordered_map<std::string, std::string>& fields)
{
	if (fields.empty())
		return std::nullopt;
	VisitorIdentity identity;
	identity.Number = number;
	identity.Account = FieldOr(fields, "account");
	identity.Workspace = ParseU64(FieldOr(fields, "workspace"), "identity workspace");
	return identity;
}

std::optional<Workspace> WorkspaceFromFields(
	WorkspaceID id, const std::unordered_map<std::string, std::string>& fields)
{
	if (fields.empty())
		return std::nullopt;
	Workspace ws;
	ws.ID = id;
	ws.Owner = FieldOr(fields, "owner");
	ws.Name = FieldOr(fields, "name");
	ws.Location = FieldOr(fields, "location");
	return ws;
}

// KEYS[1] = SlotLease, KEYS[2] = TokenLease, KEYS[3] = LeaseSeq
// ARGV[1] = key prefix, ARGV[2] = pool size, ARGV[3] = now (us),
// ARGV[4] = expires (us), ARGV[5] = token, ARGV[6] = session key
// Reply: {lease id, identity, account, workspace id, owner, name, location} or {}
const char* kClaimScript = R"lua(
local slots = KEYS[1]
local tokens = KEYS[2]
local seq = KEYS[3]
local prefix = ARGV[1]
local pool_size = tonumber(ARGV[2])
local now = tonumber(ARGV[3])

for n = 1, pool_size do
  local ident = prefix .. 'Identity:' .. n
  local account = redis.call('HGET', ident, 'account')
  local wsid = redis.call('HGET', ident, 'workspace')
  if account and wsid then
    local ws = prefix .. 'Workspace:' .. wsid
    local owner = redis.call('HGET', ws, 'owner')
    if owner == account then
      local free = true
      local held = redis.call('HGET', slots, tostring(n))
      if held then
        local held_key = prefix .. 'Lease:' .. held
        local active = redis.call('HGET', held_key, 'active')
        local expires = tonumber(redis.call('HGET', held_key, 'expires_us') or '0')
        if active == '1' and expires > now then
          free = false
        else
          redis.call('HSET', held_key, 'active', '0')
        end
      end
      if free then
        local id = tostring(redis.call('INCR', seq))
        redis.call('HSET', prefix .. 'Lease:' .. id,
          'identity', tostring(n), 'token', ARGV[5], 'session', ARGV[6],
          'created_us', ARGV[3], 'expires_us', ARGV[4], 'active', '1')
        redis.call('HSET', slots, tostring(n), id)
        redis.call('HSET', tokens, ARGV[5], id)
        return {id, tostring(n), account, wsid, owner,
                redis.call('HGET', ws, 'name') or '',
                redis.call('HGET', ws, 'location') or ''}
      end
    end
  end
end
return {}
)lua";

// KEYS[1] = SlotLease
// ARGV[1] = key prefix, ARGV[2] = now (us), ARGV[3] = limit (0 = all)
// Reply: ids of the leases that were deactivated
const char* kReclaimScript = R"lua(
local slots = KEYS[1]
local prefix = ARGV[1]
local now = tonumber(ARGV[2])
local limit = tonumber(ARGV[3])

local held = redis.call('HGETALL', slots)
local out = {}
for i = 1, #held, 2 do
  if limit > 0 and #out >= limit then
    break
  end
  local n = held[i]
  local id = held[i + 1]
  local lease = prefix .. 'Lease:' .. id
  local active = redis.call('HGET', lease, 'active')
  local expires = tonumber(redis.call('HGET', lease, 'expires_us') or '0')
  if active ~= '1' then
    redis.call('HDEL', slots, n)
  elseif expires <= now then
    redis.call('HSET', lease, 'active', '0')
    redis.call('HDEL', slots, n)
    table.insert(out, id)
  end
end
return out
)lua";

// KEYS[1] = TokenLease, KEYS[2] = SlotLease
// ARGV[1] = key prefix, ARGV[2] = token
// Reply: {lease id} when an active lease was ended, else {}
const char* kReleaseScript = R"lua(
local id = redis.call('HGET', KEYS[1], ARGV[2])
if not id then
  return {}
end
local lease = ARGV[1] .. 'Lease:' .. id
if redis.call('HGET', lease, 'active') ~= '1' then
  return {}
end
redis.call('HSET', lease, 'active', '0')
local n = redis.call('HGET', lease, 'identity')
if n and redis.call('HGET', KEYS[2], n) == id then
  redis.call('HDEL', KEYS[2], n)
end
return {id}
)lua";

// KEYS[1] = SlotLease
// ARGV[1] = key prefix, ARGV[2] = now (us)
// Reply: {allocated, expired}
const char* kCountScript = R"lua(
local held = redis.call('HGETALL', KEYS[1])
local now = tonumber(ARGV[2])
local allocated = 0
local expired = 0
for i = 2, #held, 2 do
  local lease = ARGV[1] .. 'Lease:' .. held[i]
  if redis.call('HGET', lease, 'active') == '1' then
    local expires = tonumber(redis.call('HGET', lease, 'expires_us') or '0')
    if expires > now then
      allocated = allocated + 1
    else
      expired = expired + 1
    end
  end
end
return {tostring(allocated), tostring(expired)}
)lua";

// KEYS[1] = Identity:n, KEYS[2] = Identities
// ARGV[1] = expected workspace id ('' = identity must not exist yet),
// ARGV[2] = account, ARGV[3] = new workspace id, ARGV[4] = identity number
// Reply: {'1'} when written, {} when the identity moved on
const char* kPairScript = R"lua(
local current = redis.call('HGET', KEYS[1], 'workspace')
if ARGV[1] == '' then
  if current then
    return {}
  end
elseif current ~= ARGV[1] then
  return {}
end
redis.call('HSET', KEYS[1], 'account', ARGV[2], 'workspace', ARGV[3])
redis.call('SADD', KEYS[2], ARGV[4])
return {'1'}
)lua";

// KEYS[1] = AdminLock, ARGV[1] = owner
const char* kUnlockScript = R"lua(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  redis.call('DEL', KEYS[1])
end
return {}
)lua";
}  // namespace

template <class F>
decltype(auto) RedisPoolStore::Guarded(std::string_view what, F&& f) const
{
	try
	{
		return std::forward<F>(f)();
	}
	catch (const sw::redis::Error& e)
	{
		throw PoolStorageError(std::format("Redis {} failed: {}", what, e.what()));
	}
}

RedisPoolStore::RedisPoolStore(std::shared_ptr<RedisConnection> connection)
	: Connection(std::move(connection))
{
	if (!Connection)
	{
		throw PoolStorageError("RedisPoolStore needs a connection");
	}
}

TimeUs RedisPoolStore::NowUs()
{
	return Guarded("TIME", [&] { return Connection->GetTimeNowUs(); });
}

std::optional<VisitorIdentity> RedisPoolStore::GetIdentity(IdentityNumber number)
{
	return Guarded("GetIdentity", [&]
				   { return IdentityFromFields(number, Connection->HGetAll(IdentityKey(number))); });
}

std::vector<VisitorIdentity> RedisPoolStore::GetIdentities()
{
	const auto members = Guarded("GetIdentities", [&] { return Connection->SMembers(IdentitiesKey); });

	std::vector<IdentityNumber> numbers;
	numbers.reserve(members.size());
	for (const auto& m : members)
		numbers.push_back(static_cast<IdentityNumber>(ParseU64(m, "identity number")));
	std::sort(numbers.begin(), numbers.end());

	std::vector<VisitorIdentity> out;
	out.reserve(numbers.size());
	for (const IdentityNumber n : numbers)
	{
		if (auto identity = GetIdentity(n))
			out.push_back(std::move(*identity));
	}
	return out;
}

bool RedisPoolStore::PairIdentity(const VisitorIdentity& identity,
								  std::optional<WorkspaceID> expectedWorkspace)
{
	const auto reply = Guarded("PairIdentity",
							   [&]
							   {
								   return Connection->EvalStrings(
									   kPairScript, {IdentityKey(identity.Number), IdentitiesKey},
									   {expectedWorkspace ? std::to_string(*expectedWorkspace) : std::string(),
										identity.Account, std::to_string(identity.Workspace),
										std::to_string(identity.Number)});
							   });
	return !reply.empty();
}

std::optional<Workspace> RedisPoolStore::GetWorkspace(WorkspaceID id)
{
	return Guarded("GetWorkspace",
				   [&] { return WorkspaceFromFields(id, Connection->HGetAll(WorkspaceKey(id))); });
}

Workspace RedisPoolStore::CreateWorkspace(const std::string& owner, const std::string& name,
										  const std::string& location)
{
	return Guarded("CreateWorkspace",
				   [&]
				   {
					   Workspace ws;
					   ws.ID = static_cast<WorkspaceID>(Connection->Incr(WorkspaceSeqKey));
					   ws.Owner = owner;
					   ws.Name = name;
					   ws.Location = location;
					   Connection->HSetMany(WorkspaceKey(ws.ID),
											{{"owner", ws.Owner}, {"name", ws.Name}, {"location", ws.Location}});
					   return ws;
				   });
}

std::optional<Lease> RedisPoolStore::ReadLease(LeaseID id) const
{
	const auto fields = Guarded("ReadLease", [&] { return Connection->HGetAll(LeaseKey(id)); });
	if (fields.empty())
		return std::nullopt;
	return LeaseFromFields(id, fields);
}

std::optional<Lease> RedisPoolStore::FindLeaseByToken(const std::string& token)
{
	const auto id = Guarded("FindLeaseByToken", [&] { return Connection->HGet(TokenLeaseKey, token); });
	if (!id)
		return std::nullopt;
	return ReadLease(ParseU64(*id, "lease id"));
}

std::optional<LeasedSlot> RedisPoolStore::FindLiveSlot(const std::string& token, TimeUs now)
{
	auto lease = FindLeaseByToken(token);
	if (!lease || !lease->IsLive(now))
		return std::nullopt;
	auto identity = GetIdentity(lease->Identity);
	if (!identity)
		return std::nullopt;
	auto ws = GetWorkspace(identity->Workspace);
	if (!ws || ws->Owner != identity->Account)
		return std::nullopt;
	return LeasedSlot{std::move(*lease), std::move(*identity), std::move(*ws)};
}

std::unordered_map<IdentityNumber, Lease> RedisPoolStore::GetSlotLeases()
{
	const auto held = Guarded("GetSlotLeases", [&] { return Connection->HGetAll(SlotLeaseKey); });
	std::unordered_map<IdentityNumber, Lease> out;
	for (const auto& [number, id] : held)
	{
		auto lease = ReadLease(ParseU64(id, "lease id"));
		if (lease && lease->Active)
			out.emplace(static_cast<IdentityNumber>(ParseU64(number, "identity number")),
						std::move(*lease));
	}
	return out;
}

std::optional<LeasedSlot> RedisPoolStore::ClaimFreeSlot(uint32_t poolSize, const LeaseRequest& request)
{
	const TimeUs expires = request.NowUs + request.LifetimeUs;
	const auto reply = Guarded("ClaimFreeSlot",
							   [&]
							   {
								   return Connection->EvalStrings(
									   kClaimScript, {SlotLeaseKey, TokenLeaseKey, LeaseSeqKey},
									   {Prefix, std::to_string(poolSize), std::to_string(request.NowUs),
										std::to_string(expires), request.Token, request.SessionKey});
							   });
	if (reply.empty())
		return std::nullopt;
	if (reply.size() != 7)
	{
		throw PoolStorageError(std::format("Claim script replied with {} fields", reply.size()));
	}

	LeasedSlot slot;
	slot.lease.ID = ParseU64(reply[0], "lease id");
	slot.lease.Identity = static_cast<IdentityNumber>(ParseU64(reply[1], "identity number"));
	slot.lease.Token = request.Token;
	slot.lease.SessionKey = request.SessionKey;
	slot.lease.CreatedAtUs = request.NowUs;
	slot.lease.ExpiresAtUs = expires;
	slot.lease.Active = true;

	slot.identity.Number = slot.lease.Identity;
	slot.identity.Account = reply[2];
	slot.identity.Workspace = ParseU64(reply[3], "workspace id");

	slot.workspace.ID = slot.identity.Workspace;
	slot.workspace.Owner = reply[4];
	slot.workspace.Name = reply[5];
	slot.workspace.Location = reply[6];
	return slot;
}

std::vector<Lease> RedisPoolStore::ReclaimExpired(TimeUs now, uint32_t limit)
{
	const auto ids = Guarded("ReclaimExpired",
							 [&]
							 {
								 return Connection->EvalStrings(
									 kReclaimScript, {SlotLeaseKey},
									 {Prefix, std::to_string(now), std::to_string(limit)});
							 });
	std::vector<Lease> freed;
	freed.reserve(ids.size());
	for (const auto& id : ids)
	{
		if (auto lease = ReadLease(ParseU64(id, "lease id")))
			freed.push_back(std::move(*lease));
	}
	return freed;
}

std::optional<Lease> RedisPoolStore::DeactivateLease(const std::string& token)
{
	const auto ids = Guarded("DeactivateLease",
							 [&]
							 {
								 return Connection->EvalStrings(kReleaseScript,
																{TokenLeaseKey, SlotLeaseKey},
																{Prefix, token});
							 });
	if (ids.empty())
		return std::nullopt;
	return ReadLease(ParseU64(ids.front(), "lease id"));
}

template <class Handle>
TransferOutcome RedisPoolStore::TransferWith(Handle& handle, LeaseID leaseID,
											 const std::string& newOwner, TimeUs now,
											 const TransferStep& step)
{
	auto tx = [&]
	{
		if constexpr (std::is_same_v<Handle, sw::redis::RedisCluster>)
			return handle.transaction("{VisitorPool}");
		else
			return handle.transaction();
	}();
	auto r = tx.redis();

	const std::string leaseKey = LeaseKey(leaseID);
	const std::vector<std::string> leaseKeys = {leaseKey, SlotLeaseKey};
	r.watch(leaseKeys.begin(), leaseKeys.end());

	auto Abandon = [&](TransferOutcome outcome)
	{
		r.command("UNWATCH");
		return outcome;
	};

	std::unordered_map<std::string, std::string> fields;
	r.hgetall(leaseKey, std::inserter(fields, fields.end()));
	if (fields.empty())
		return Abandon(TransferOutcome::eNoLease);
	const Lease lease = LeaseFromFields(leaseID, fields);
	if (!lease.IsLive(now))
		return Abandon(TransferOutcome::eConflict);

	const std::string slotField = std::to_string(lease.Identity);
	const auto held = r.hget(SlotLeaseKey, slotField);
	if (!held || *held != std::to_string(leaseID))
		return Abandon(TransferOutcome::eConflict);

	const std::string identityKey = IdentityKey(lease.Identity);
	r.watch(identityKey);
	fields.clear();
	r.hgetall(identityKey, std::inserter(fields, fields.end()));
	const auto identity = IdentityFromFields(lease.Identity, fields);
	if (!identity)
		return Abandon(TransferOutcome::eConflict);

	const std::string workspaceKey = WorkspaceKey(identity->Workspace);
	r.watch(workspaceKey);
	fields.clear();
	r.hgetall(workspaceKey, std::inserter(fields, fields.end()));
	const auto ws = WorkspaceFromFields(identity->Workspace, fields);
	if (!ws || ws->Owner != identity->Account)
		return Abandon(TransferOutcome::eConflict);

	std::string location;
	if (step)
	{
		try
		{
			location = step(LeasedSlot{lease, *identity, *ws});
		}
		catch (const std::exception& e)
		{
			logger->DebugFormatted("Transfer step failed for lease {}, abandoning: {}", leaseID,
									 e.what());
			r.command("UNWATCH");
			throw;
		}
	}

	try
	{
		tx.hset(workspaceKey, "owner", newOwner);
		if (!location.empty())
			tx.hset(workspaceKey, "location", location);
		tx.hset(leaseKey, "active", "0").hdel(SlotLeaseKey, slotField).exec();
	}
	catch (const sw::redis::WatchError&)
	{
		return TransferOutcome::eConflict;
	}
	return TransferOutcome::eTransferred;
}

TransferOutcome RedisPoolStore::TransferWorkspace(const std::string& token,
												  const std::string& newOwner, TimeUs now,
												  const TransferStep& step)
{
	const auto id = Guarded("TransferWorkspace", [&] { return Connection->HGet(TokenLeaseKey, token); });
	if (!id)
		return TransferOutcome::eNoLease;
	const LeaseID leaseID = ParseU64(*id, "lease id");

	return Guarded("TransferWorkspace",
				   [&]
				   {
					   return Connection->WithSync([&](auto& handle) -> TransferOutcome
												   { return TransferWith(handle, leaseID, newOwner, now, step); });
				   });
}

LeaseCounts RedisPoolStore::CountActiveLeases(TimeUs now)
{
	const auto reply = Guarded("CountActiveLeases",
							   [&]
							   {
								   return Connection->EvalStrings(kCountScript, {SlotLeaseKey},
																  {Prefix, std::to_string(now)});
							   });
	if (reply.size() != 2)
	{
		throw PoolStorageError(std::format("Count script replied with {} fields", reply.size()));
	}
	LeaseCounts counts;
	counts.Allocated = static_cast<uint32_t>(ParseU64(reply[0], "allocated count"));
	counts.Expired = static_cast<uint32_t>(ParseU64(reply[1], "expired count"));
	return counts;
}

bool RedisPoolStore::AcquireAdminLock(const std::string& owner, std::chrono::milliseconds ttl)
{
	return Guarded("AcquireAdminLock", [&] { return Connection->SetIfAbsent(AdminLockKey, owner, ttl); });
}

void RedisPoolStore::ReleaseAdminLock(const std::string& owner)
{
	Guarded("ReleaseAdminLock",
			[&]
			{
				[[maybe_unused]] const auto reply =
					Connection->EvalStrings(kUnlockScript, {AdminLockKey}, {owner});
			});
}
