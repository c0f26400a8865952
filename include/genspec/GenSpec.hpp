#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/path/JsonPointer.hpp>
#include <genspec/path/PointerIterator.hpp>
#include <genspec/state/StateStore.hpp>

#include <genspec/expr/Expression.hpp>
#include <genspec/expr/ExpressionResolver.hpp>

#include <genspec/action/ActionBinding.hpp>
#include <genspec/action/ActionDispatcher.hpp>
#include <genspec/action/FormValidation.hpp>

#include <genspec/document/Patch.hpp>
#include <genspec/document/Spec.hpp>
#include <genspec/document/SpecStore.hpp>
#include <genspec/document/SpecValidator.hpp>

#include <genspec/stream/GenerationOptions.hpp>
#include <genspec/stream/GenerationTransport.hpp>
#include <genspec/stream/LineParser.hpp>
#include <genspec/stream/StreamIngester.hpp>
