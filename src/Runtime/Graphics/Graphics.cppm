export module Graphics;

export import :Rect;
export import :Color;
export import :Shader;
export import :Texture;
export import :TextureSource;
export import :TextureMemory;
export import :RenderOp;
