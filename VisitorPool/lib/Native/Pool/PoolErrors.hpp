#pragma once
#include <stdexcept>
#include <string>

// The store could not be reached or answered garbage. This is the only pool
// failure that escapes to the request path.
class PoolStorageError : public std::runtime_error
{
   public:
	using std::runtime_error::runtime_error;
};

class PoolConfigError : public std::runtime_error
{
   public:
	using std::runtime_error::runtime_error;
};

class PoolBootstrapError : public std::runtime_error
{
   public:
	using std::runtime_error::runtime_error;
};
