#pragma once

// execq_cli serve [--host H] [--port P] [--workers N]
int cmd_serve(int argc, char** argv);
