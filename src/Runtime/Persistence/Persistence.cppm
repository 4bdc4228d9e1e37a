export module Persistence;

export import :ParseError;
export import :FloatText;
export import :LineSource;
export import :ByteSink;
export import :TransformCodec;
export import :StateFiles;
export import :TransformPersistence;
