#ifndef SIGNALS_HPP
#define SIGNALS_HPP

// SIGINT handling shared by both executables. The handler only records the
// request; a blocked receive returns INTERRUPTED because SA_RESTART is not set,
// and loops poll InterruptRequested() between steps.
void InstallInterruptHandler();
bool InterruptRequested();
void ClearInterruptRequest();

#endif // SIGNALS_HPP
