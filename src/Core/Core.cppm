export module Core;

// Re-export all sub-systems so users only need 'import Core;'
export import :Error;
export import :Logging;
export import :Handle;
export import :Hash;
export import :ResourcePool;
export import :Tasks;
