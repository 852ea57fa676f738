export module Scene;

export import :Properties;
export import :Events;
export import :Components.Node;
export import :Components.Hierarchy;
export import :Components.Transform;
export import :Components.Visibility;
export import :Components.BatchCache;
export import :SceneGraph;
export import :Systems.Transform;
export import :Systems.Bounds;
export import :Systems.Batching;
