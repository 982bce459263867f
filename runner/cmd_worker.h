#pragma once

// execq_cli worker [--workers N] [--once]
int cmd_worker(int argc, char** argv);

// execq_cli reconcile
int cmd_reconcile(int argc, char** argv);

// execq_cli exec <request.json|->
int cmd_exec(int argc, char** argv);
