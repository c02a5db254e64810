#pragma once

#include <composespace/core/DiagnosticSink.hpp>
#include <composespace/core/Error.hpp>
#include <composespace/core/Value.hpp>
#include <composespace/hydration/ClientBootstrap.hpp>
#include <composespace/hydration/HydrationCodec.hpp>
#include <composespace/hydration/HydrationContext.hpp>
#include <composespace/hydration/HydrationManager.hpp>
#include <composespace/hydration/TreeMatcher.hpp>
#include <composespace/runtime/Composer.hpp>
#include <composespace/runtime/Composition.hpp>
#include <composespace/runtime/CompositionLocal.hpp>
#include <composespace/runtime/DependencyTracker.hpp>
#include <composespace/runtime/RenderScope.hpp>
#include <composespace/runtime/Renderer.hpp>
#include <composespace/runtime/SavedStateRegistry.hpp>
#include <composespace/runtime/Scheduler.hpp>
#include <composespace/runtime/StateCell.hpp>
#include <composespace/snapshot/ComponentNode.hpp>
#include <composespace/snapshot/SnapshotJson.hpp>
#include <composespace/ssr/HtmlRenderer.hpp>
#include <composespace/ssr/ServerRender.hpp>
