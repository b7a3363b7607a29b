// Copyright 2022 Eric Fichter
#ifndef TRANSACTION_H
#define TRANSACTION_H

#include "headers.h"

class Model;

//! Groups entity creations and relationship updates on a model to one atomic unit.
//! Entities handed to add() are owned by the transaction until commit. On commit they are added to the file in creation order, afterwards the registered commit actions run.
//! If the transaction is aborted or goes out of scope without commit, all pending entities are deleted and the file stays untouched.
//! A model admits only one active transaction. A second one throws TransactionError.
class Transaction {

public:
    Transaction(Model &_model, std::string _label);

    ~Transaction();

    Transaction(const Transaction &) = delete;

    Transaction &operator=(const Transaction &) = delete;

    template<typename T>
    T *add(T *entity) {
        if (state != ACTIVE) throw TransactionError("Transaction '" + name + "' is not active.");
        pending.emplace_back(entity);
        return entity;
    }

    //! Action that modifies already committed entities. Runs after the pending entities were added to the file.
    //! The transaction counts as committed when the actions run. An exception thrown by an action propagates from commit() without rollback.
    void on_commit(std::function<void()> action);

    void commit();

    void abort();

    bool active() const { return state == ACTIVE; }

    bool committed() const { return state == COMMITTED; }

    bool aborted() const { return state == ABORTED; }

    const std::string &label() const { return name; }

    size_t size() const { return pending.size(); }

private:
    enum transaction_state {
        ACTIVE,
        COMMITTED,
        ABORTED
    };

    Model &model;
    const std::string name;
    transaction_state state;
    std::vector<std::unique_ptr<IfcUtil::IfcBaseClass>> pending;
    std::vector<std::function<void()>> actions;

    void rollback();

    void release_model();
};

#endif //TRANSACTION_H
