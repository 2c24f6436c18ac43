// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Reconciliation Task Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#include "common/Errors.h"
#include "model/StateGraph.h"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace RTE {

class StateGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler = std::make_shared<FunctionHandler>([](HandlerContext &) -> TransitionResult { return std::nullopt; });
    }

    StateOptions automatic(Duration interval = 30s) {
        StateOptions options;
        options.tryInterval = interval;
        options.handler = handler;
        return options;
    }

    std::shared_ptr<IStateHandler> handler;
};

TEST_F(StateGraphTest, ResolvesStateKinds) {
    StateOptions external;
    external.externallyProgressed = true;

    auto graph = StateGraph::Builder("order")
                     .state("new", automatic(10s))
                     .state("awaiting_payment", external)
                     .state("paid", automatic())
                     .state("shipped")
                     .transition("new", "awaiting_payment")
                     .transition("awaiting_payment", "paid")
                     .transition("paid", "shipped")
                     .build();

    EXPECT_EQ(graph->name(), "order");
    EXPECT_EQ(graph->initialState(), "new");
    EXPECT_EQ(graph->automaticStates(), (std::vector<std::string>{"new", "paid"}));
    EXPECT_EQ(graph->terminalStates(), (std::vector<std::string>{"shipped"}));

    EXPECT_EQ(graph->handlerFor("new"), handler.get());
    EXPECT_EQ(graph->handlerFor("awaiting_payment"), nullptr);
    EXPECT_EQ(graph->handlerFor("shipped"), nullptr);

    EXPECT_FALSE(graph->isTerminalOrExternal("new"));
    EXPECT_TRUE(graph->isTerminalOrExternal("awaiting_payment"));
    EXPECT_TRUE(graph->isTerminalOrExternal("shipped"));
    EXPECT_TRUE(graph->isTerminal("shipped"));
    EXPECT_FALSE(graph->isTerminal("awaiting_payment"));

    EXPECT_EQ(graph->tryInterval("new"), Duration(10s));
    EXPECT_EQ(graph->tryInterval("shipped"), std::nullopt);
}

TEST_F(StateGraphTest, UnknownStatesAreNeverDispatched) {
    auto graph = StateGraph::Builder("t").state("a", automatic()).state("b").transition("a", "b").build();

    EXPECT_FALSE(graph->hasState("ghost"));
    EXPECT_EQ(graph->handlerFor("ghost"), nullptr);
    EXPECT_TRUE(graph->isTerminalOrExternal("ghost"));
    EXPECT_EQ(graph->tryInterval("ghost"), std::nullopt);
    EXPECT_FALSE(graph->validTransition("ghost", "b"));
    EXPECT_FALSE(graph->validTransition("a", "ghost"));
}

TEST_F(StateGraphTest, ValidTransitionFollowsDeclaredEdges) {
    auto graph = StateGraph::Builder("t")
                     .state("a", automatic())
                     .state("b", automatic())
                     .state("c")
                     .transition("a", "b")
                     .transition("b", "c")
                     .timeout("a", "c", 1h)
                     .build();

    EXPECT_TRUE(graph->validTransition("a", "b"));
    EXPECT_TRUE(graph->validTransition("a", "c"));  // Timeout target
    EXPECT_FALSE(graph->validTransition("b", "a"));
    EXPECT_FALSE(graph->validTransition("c", "a"));

    auto timeout = graph->timeoutFor("a");
    ASSERT_TRUE(timeout.has_value());
    EXPECT_EQ(timeout->first, "c");
    EXPECT_EQ(timeout->second, Duration(1h));
    EXPECT_FALSE(graph->timeoutFor("b").has_value());
}

TEST_F(StateGraphTest, RetryableStatesExcludeManualOnly) {
    StateOptions manual;
    manual.manualOnly = true;
    manual.handler = handler;

    StateOptions manualWithInterval = manual;
    manualWithInterval.tryInterval = 5s;

    auto graph = StateGraph::Builder("t")
                     .state("a", automatic(15s))
                     .state("b", manual)
                     .state("c", manualWithInterval)
                     .state("d")
                     .transition("a", "b")
                     .transition("b", "c")
                     .transition("c", "d")
                     .build();

    EXPECT_EQ(graph->automaticStates(), (std::vector<std::string>{"a", "b", "c"}));
    ASSERT_EQ(graph->retryableStates().size(), 1u);
    EXPECT_EQ(graph->retryableStates()[0].first, "a");
    EXPECT_EQ(graph->retryableStates()[0].second, Duration(15s));
}

TEST_F(StateGraphTest, HandlerCanBeAttachedSeparately) {
    StateOptions options;
    options.tryInterval = 1s;

    auto graph = StateGraph::Builder("t")
                     .state("a", options)
                     .state("b")
                     .transition("a", "b")
                     .handler("a", handler)
                     .build();

    EXPECT_EQ(graph->handlerFor("a"), handler.get());
}

TEST_F(StateGraphTest, NewRecordStartsInInitialState) {
    auto graph = StateGraph::Builder("t").state("a", automatic()).state("b").transition("a", "b").build();
    Timestamp now = Clock::now();

    auto record = graph->newRecord("42", now);
    EXPECT_EQ(record.key, (EntityKey{"t", "42"}));
    EXPECT_EQ(record.state, "a");
    EXPECT_TRUE(record.ready);
    EXPECT_EQ(record.changedAt, now);
    EXPECT_FALSE(record.lastAttemptedAt.has_value());
    EXPECT_FALSE(record.leaseExpiresAt.has_value());
}

TEST_F(StateGraphTest, DeferredInitialStateWaitsOneInterval) {
    auto options = automatic();
    options.attemptImmediately = false;
    auto graph = StateGraph::Builder("t").state("a", options).state("b").transition("a", "b").build();
    Timestamp now = Clock::now();

    EXPECT_FALSE(graph->attemptsImmediately("a"));
    EXPECT_TRUE(graph->attemptsImmediately("b"));

    auto record = graph->newRecord("1", now);
    EXPECT_FALSE(record.ready);
    EXPECT_EQ(record.lastAttemptedAt, now);
}

TEST_F(StateGraphTest, ExplicitAndForcedInitialState) {
    auto explicitGraph = StateGraph::Builder("t")
                             .state("a", automatic())
                             .state("b", automatic())
                             .state("c")
                             .transition("a", "c")
                             .transition("b", "c")
                             .initialState("b")
                             .build();
    EXPECT_EQ(explicitGraph->initialState(), "b");

    auto looping = automatic();
    looping.forceInitial = true;
    auto forcedGraph = StateGraph::Builder("t")
                           .state("poll", looping)
                           .state("check", automatic())
                           .state("done")
                           .transition("poll", "check")
                           .transition("check", "poll")
                           .transition("check", "done")
                           .build();
    EXPECT_EQ(forcedGraph->initialState(), "poll");
}

TEST_F(StateGraphTest, RejectsUndeclaredTransitionTarget) {
    EXPECT_THROW(StateGraph::Builder("t").state("a", automatic()).transition("a", "missing").build(),
                 GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t").state("a", automatic()).state("b").timeout("a", "missing", 1s).build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, RejectsMissingHandlerOnAutomaticState) {
    StateOptions noHandler;
    noHandler.tryInterval = 1s;
    EXPECT_THROW(StateGraph::Builder("t").state("a", noHandler).state("b").transition("a", "b").build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, RejectsHandlerOnTerminalOrExternalState) {
    EXPECT_THROW(StateGraph::Builder("t")
                     .state("a", automatic())
                     .state("b", automatic())
                     .transition("a", "b")
                     .build(),
                 GraphDefinitionError);

    auto external = automatic();
    external.externallyProgressed = true;
    EXPECT_THROW(StateGraph::Builder("t").state("a", external).state("b").transition("a", "b").build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, RejectsAutomaticStateWithoutIntervalOrManualFlag) {
    StateOptions options;
    options.handler = handler;
    EXPECT_THROW(StateGraph::Builder("t").state("a", options).state("b").transition("a", "b").build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, RejectsAmbiguousOrMissingInitialState) {
    EXPECT_THROW(StateGraph::Builder("t")
                     .state("a", automatic())
                     .state("b", automatic())
                     .state("c")
                     .transition("a", "c")
                     .transition("b", "c")
                     .build(),
                 GraphDefinitionError);

    EXPECT_THROW(StateGraph::Builder("t")
                     .state("a", automatic())
                     .state("b", automatic())
                     .transition("a", "b")
                     .transition("b", "a")
                     .build(),
                 GraphDefinitionError);

    EXPECT_THROW(StateGraph::Builder("t").state("a", automatic()).state("b").transition("a", "b").initialState("x").build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, RejectsMalformedDeclarations) {
    EXPECT_THROW(StateGraph::Builder("").state("a").build(), GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t").build(), GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t").state("a").state("a").build(), GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t").state("").build(), GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t").state("a", automatic(0s)).state("b").transition("a", "b").build(),
                 GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t")
                     .state("a", automatic())
                     .state("b")
                     .state("c")
                     .transition("a", "b")
                     .timeout("a", "b", 1s)
                     .timeout("a", "c", 2s)
                     .build(),
                 GraphDefinitionError);
    EXPECT_THROW(StateGraph::Builder("t").state("a", automatic()).state("b").timeout("a", "b", 0s).build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, RejectsTimeoutOnExternalState) {
    StateOptions external;
    external.externallyProgressed = true;
    EXPECT_THROW(StateGraph::Builder("t")
                     .state("a", external)
                     .state("b")
                     .transition("a", "b")
                     .timeout("a", "b", 1s)
                     .build(),
                 GraphDefinitionError);
}

TEST_F(StateGraphTest, ErrorMessageNamesGraph) {
    try {
        StateGraph::Builder("invoice").state("a", automatic()).transition("a", "nowhere").build();
        FAIL() << "Expected GraphDefinitionError";
    } catch (const GraphDefinitionError &e) {
        EXPECT_EQ(e.graphName(), "invoice");
        EXPECT_NE(std::string(e.what()).find("nowhere"), std::string::npos);
    }
}

}  // namespace RTE
