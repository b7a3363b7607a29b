// Copyright 2022 Eric Fichter
#include "Transaction.h"
#include "Model.h"

Transaction::Transaction(Model &_model, std::string _label) : model(_model), name(std::move(_label)), state(ACTIVE) {

    bool expected = false;
    if (!model.transaction_active.compare_exchange_strong(expected, true))
        throw TransactionError("Cannot start transaction '" + name + "'. Another transaction is active on model " + model.project_name() + ".");
}

Transaction::~Transaction() {
    if (state == ACTIVE)
        rollback();
}

void Transaction::on_commit(std::function<void()> action) {
    if (state != ACTIVE) throw TransactionError("Transaction '" + name + "' is not active.");
    actions.push_back(std::move(action));
}

void Transaction::commit() {

    if (state != ACTIVE)
        throw TransactionError("Transaction '" + name + "' cannot be committed. It is " + (state == COMMITTED ? "already committed." : "aborted."));

    // entities only reference entities created before them, so every addEntity finds its references in the file
    for (auto &entity: pending) {
        model.file()->addEntity(entity.get());
        entity.release(); // owned by the file now
    }
    pending.clear();

    // the file is changed from here on, a throwing action cannot roll it back
    state = COMMITTED;
    release_model();

    std::vector<std::function<void()>> A;
    A.swap(actions);
    for (auto &action: A)
        action();
}

void Transaction::abort() {

    if (state != ACTIVE)
        throw TransactionError("Transaction '" + name + "' cannot be aborted. It is " + (state == COMMITTED ? "already committed." : "aborted."));

    rollback();
}

void Transaction::rollback() {

    actions.clear();

    // delete in reverse order of creation
    while (!pending.empty())
        pending.pop_back();

    state = ABORTED;
    release_model();
}

void Transaction::release_model() { model.transaction_active = false; }
