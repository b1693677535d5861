/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "test_helpers.h"

class IterableUtilsTest : public RuntimeTest {};

// ============================================================================
// IterableToList
// ============================================================================

TEST_F(IterableUtilsTest, CollectsValuesInOrder) {
    Object* iterable = list_iterable({Value("a"), Value("b"), Value("c")});

    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(iterable));

    EXPECT_FALSE(ctx->has_exception());
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0].to_string(), "a");
    EXPECT_EQ(values[1].to_string(), "b");
    EXPECT_EQ(values[2].to_string(), "c");
}

TEST_F(IterableUtilsTest, EmptyIterable) {
    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(list_iterable({})));

    EXPECT_FALSE(ctx->has_exception());
    EXPECT_TRUE(values.empty());
}

TEST_F(IterableUtilsTest, ExplicitMethodOverridesSymbolIterator) {
    Object* iterable = list_iterable({Value("from symbol")});
    Function* method = native("custom", [](Context& ctx, const std::vector<Value>&) -> Value {
        return Value(IteratorOperations::create_list_iterator(ctx, {Value("x"), Value("y")}));
    });

    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(iterable), Value(method));

    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0].to_string(), "x");
    EXPECT_EQ(values[1].to_string(), "y");
}

TEST_F(IterableUtilsTest, DrainingNeverCallsReturn) {
    int return_calls = 0;
    Object* iterator = counting_iterator(4, return_calls);

    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(iterable_of(iterator)));

    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[3].as_number(), 3);
    EXPECT_EQ(return_calls, 0);
}

TEST_F(IterableUtilsTest, NextFailureDiscardsPartialListWithoutClosing) {
    int return_calls = 0;
    auto calls = std::make_shared<int>(0);
    Value thrown = error_value("second next");
    Object* iterator = scripted_iterator(
        [calls, thrown](Context& ctx, const std::vector<Value>&) -> Value {
            if ((*calls)++ == 0) {
                return Value(AbstractOperations::create_iter_result_object(ctx, Value("first"), false));
            }
            ctx.throw_exception(thrown);
            return Value();
        },
        [&return_calls](Context& ctx, const std::vector<Value>&) -> Value {
            return_calls++;
            return Value(AbstractOperations::create_iter_result_object(ctx, Value(), true));
        });

    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(iterable_of(iterator)));

    EXPECT_TRUE(values.empty());
    ASSERT_TRUE(ctx->has_exception());
    EXPECT_TRUE(ctx->get_exception().same_value(thrown));
    EXPECT_EQ(return_calls, 0);
}

TEST_F(IterableUtilsTest, NonIterableIsTypeError) {
    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(5));

    EXPECT_TRUE(values.empty());
    EXPECT_TRUE(pending_type_error());
}

TEST_F(IterableUtilsTest, ValueGetterFailurePropagates) {
    Object* bad_result = object();
    bad_result->set_property("done", Value(false));
    bad_result->define_accessor_property("value", native("get value",
        [](Context& ctx, const std::vector<Value>&) -> Value {
            ctx.throw_reference_error("value getter");
            return Value();
        }), nullptr);
    Object* iterator = scripted_iterator([bad_result](Context&, const std::vector<Value>&) -> Value {
        return Value(bad_result);
    });

    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(iterable_of(iterator)));

    EXPECT_TRUE(values.empty());
    ASSERT_TRUE(ctx->has_exception());
    EXPECT_TRUE(Error::is_error_of_type(ctx->get_exception(), Error::Type::ReferenceError));
}

TEST_F(IterableUtilsTest, NestedCollectionFromInsideNext) {
    Object* inner = list_iterable({Value(10), Value(20)});
    auto done = std::make_shared<bool>(false);
    Object* iterator = scripted_iterator([inner, done](Context& ctx, const std::vector<Value>&) -> Value {
        if (*done) {
            return Value(AbstractOperations::create_iter_result_object(ctx, Value(), true));
        }
        *done = true;
        std::vector<Value> nested = IterableUtils::iterable_to_list(ctx, Value(inner));
        return Value(AbstractOperations::create_iter_result_object(ctx, Value(static_cast<double>(nested.size())), false));
    });

    std::vector<Value> values = IterableUtils::iterable_to_list(*ctx, Value(iterable_of(iterator)));

    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0].as_number(), 2);
}

TEST_F(IterableUtilsTest, IsIterable) {
    Object* broken = object();
    broken->set_property(iterator_key(), Value(1));

    EXPECT_TRUE(IterableUtils::is_iterable(*ctx, Value(list_iterable({}))));
    EXPECT_TRUE(IterableUtils::is_iterable(*ctx, Value(IteratorOperations::create_list_iterator(*ctx, {}))));
    EXPECT_FALSE(IterableUtils::is_iterable(*ctx, Value(object())));
    EXPECT_FALSE(IterableUtils::is_iterable(*ctx, Value(broken)));
    EXPECT_FALSE(IterableUtils::is_iterable(*ctx, Value("abc")));
    EXPECT_FALSE(IterableUtils::is_iterable(*ctx, Value()));
    EXPECT_FALSE(ctx->has_exception());
}

// ============================================================================
// for-of
// ============================================================================

TEST_F(IterableUtilsTest, ForOfVisitsEveryValue) {
    std::vector<std::string> seen;

    Completion result = IterableUtils::for_of_loop(*ctx, Value(list_iterable({Value("a"), Value("b")})),
        [&seen](const Value& v) {
            seen.push_back(v.to_string());
            return Completion::normal(v);
        });

    EXPECT_TRUE(result.is_normal());
    EXPECT_EQ(result.get_value().to_string(), "b");
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

TEST_F(IterableUtilsTest, ForOfExhaustionDoesNotClose) {
    int return_calls = 0;
    Object* iterator = counting_iterator(2, return_calls);

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [](const Value&) { return Completion::normal(); });

    EXPECT_TRUE(result.is_normal());
    EXPECT_EQ(return_calls, 0);
}

TEST_F(IterableUtilsTest, ForOfBreakClosesAndCompletesNormally) {
    int return_calls = 0;
    int visits = 0;
    Object* iterator = counting_iterator(5, return_calls);

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [&visits](const Value& v) {
            visits++;
            if (v.as_number() == 1) {
                return Completion::break_completion();
            }
            return Completion::normal(v);
        });

    EXPECT_TRUE(result.is_normal());
    EXPECT_EQ(result.get_value().as_number(), 0);
    EXPECT_EQ(visits, 2);
    EXPECT_EQ(return_calls, 1);
}

TEST_F(IterableUtilsTest, ForOfLabelledBreakPropagates) {
    int return_calls = 0;
    Object* iterator = counting_iterator(5, return_calls);

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [](const Value&) { return Completion::break_completion("outer"); });

    EXPECT_TRUE(result.is_break());
    EXPECT_EQ(result.get_target(), "outer");
    EXPECT_EQ(return_calls, 1);
}

TEST_F(IterableUtilsTest, ForOfReturnClosesAndPropagates) {
    int return_calls = 0;
    Object* iterator = counting_iterator(5, return_calls);

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [](const Value&) { return Completion::return_completion(Value("early")); });

    EXPECT_TRUE(result.is_return());
    EXPECT_EQ(result.get_value().to_string(), "early");
    EXPECT_EQ(return_calls, 1);
}

TEST_F(IterableUtilsTest, ForOfThrowClosesAndKeepsError) {
    int return_calls = 0;
    Object* iterator = counting_iterator(5, return_calls);
    Value thrown = error_value("body");

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [thrown](const Value&) { return Completion::throw_completion(thrown); });

    ASSERT_TRUE(result.is_throw());
    EXPECT_TRUE(result.get_value().same_value(thrown));
    EXPECT_EQ(return_calls, 1);
    EXPECT_FALSE(ctx->has_exception());
}

TEST_F(IterableUtilsTest, ForOfBodyExceptionOnContextCloses) {
    int return_calls = 0;
    Object* iterator = counting_iterator(5, return_calls);
    Context* context = ctx;

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [context](const Value&) {
            context->throw_range_error("body failed");
            return Completion::normal();
        });

    ASSERT_TRUE(result.is_throw());
    EXPECT_TRUE(Error::is_error_of_type(result.get_value(), Error::Type::RangeError));
    EXPECT_EQ(return_calls, 1);
    EXPECT_FALSE(ctx->has_exception());
}

TEST_F(IterableUtilsTest, ForOfContinueKeepsIterating) {
    int return_calls = 0;
    int visits = 0;
    Object* iterator = counting_iterator(3, return_calls);

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [&visits](const Value&) {
            visits++;
            return Completion::continue_completion();
        });

    EXPECT_TRUE(result.is_normal());
    EXPECT_EQ(visits, 3);
    EXPECT_EQ(return_calls, 0);
}

TEST_F(IterableUtilsTest, ForOfLabelledContinueCloses) {
    int return_calls = 0;
    Object* iterator = counting_iterator(3, return_calls);

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [](const Value&) { return Completion::continue_completion("outer"); });

    EXPECT_TRUE(result.is_continue());
    EXPECT_EQ(result.get_target(), "outer");
    EXPECT_EQ(return_calls, 1);
}

TEST_F(IterableUtilsTest, ForOfNonIterableIsThrowCompletion) {
    bool ran = false;

    Completion result = IterableUtils::for_of_loop(*ctx, Value(object()),
        [&ran](const Value&) {
            ran = true;
            return Completion::normal();
        });

    ASSERT_TRUE(result.is_throw());
    EXPECT_TRUE(Error::is_error_of_type(result.get_value(), Error::Type::TypeError));
    EXPECT_FALSE(ran);
    EXPECT_FALSE(ctx->has_exception());
}

TEST_F(IterableUtilsTest, ForOfBreakWithFailingReturnThrows) {
    Value cleanup = error_value("cleanup");
    Object* iterator = scripted_iterator(
        [](Context& ctx, const std::vector<Value>&) -> Value {
            return Value(AbstractOperations::create_iter_result_object(ctx, Value(1), false));
        },
        [cleanup](Context& ctx, const std::vector<Value>&) -> Value {
            ctx.throw_exception(cleanup);
            return Value();
        });

    Completion result = IterableUtils::for_of_loop(*ctx, Value(iterable_of(iterator)),
        [](const Value&) { return Completion::break_completion(); });

    ASSERT_TRUE(result.is_throw());
    EXPECT_TRUE(result.get_value().same_value(cleanup));
}
